// Copyright 2024 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "mnemonic.h"

#include <bitcoin/bitcoin.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <boost/algorithm/string.hpp>

namespace warden
{
    namespace
    {
        const std::string passphrasePrefix = "mnemonic";
        const int hmacIterations = 2048;
        const size_t sizeHash = 512 >> 3;
    }

    std::vector<uint8_t> getEntropy(size_t size)
    {
        std::vector<uint8_t> res(size);
        if (RAND_bytes(res.data(), static_cast<int>(res.size())) != 1)
            throw MnemonicException("cannot generate entropy");

        return res;
    }

    WordList createMnemonic(const std::vector<uint8_t>& entropy)
    {
        if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0)
            throw MnemonicException("invalid entropy size");

        libbitcoin::data_chunk data(entropy.begin(), entropy.end());
        auto words = libbitcoin::wallet::create_mnemonic(data, libbitcoin::wallet::language::en);
        OPENSSL_cleanse(data.data(), data.size());
        if (words.empty())
            throw MnemonicException("cannot create mnemonic");

        WordList res(words.begin(), words.end());
        wipeMnemonic(words);
        return res;
    }

    std::vector<uint8_t> decodeMnemonic(const WordList& words)
    {
        std::string sentence = boost::join(words, " ");
        std::vector<uint8_t> hash(sizeHash);

        const int result = PKCS5_PBKDF2_HMAC(
            sentence.data(),
            static_cast<int>(sentence.size()),
            reinterpret_cast<const unsigned char*>(passphrasePrefix.data()),
            static_cast<int>(passphrasePrefix.size()),
            hmacIterations,
            EVP_sha512(),
            static_cast<int>(hash.size()),
            hash.data());

        OPENSSL_cleanse(&sentence[0], sentence.size());

        if (result != 1)
            throw MnemonicException("pbkdf2 returned bad result");

        return hash;
    }

    bool isAllowedWordCount(size_t count)
    {
        return count >= 12 && count <= 24 && count % 3 == 0;
    }

    bool isValidMnemonic(const WordList& words)
    {
        if (!isAllowedWordCount(words.size()))
            return false;

        libbitcoin::wallet::word_list list(words.begin(), words.end());
        const bool res = libbitcoin::wallet::validate_mnemonic(list, libbitcoin::wallet::language::en);
        wipeMnemonic(list);
        return res;
    }

    WordList parseMnemonic(const std::string& phrase)
    {
        WordList words;
        std::string normalized = phrase;
        boost::algorithm::trim(normalized);
        boost::algorithm::to_lower(normalized);
        if (normalized.empty())
            return words;

        boost::algorithm::split(words, normalized, boost::is_any_of(" \t\r\n"), boost::token_compress_on);
        OPENSSL_cleanse(&normalized[0], normalized.size());
        return words;
    }

    void wipeMnemonic(WordList& words)
    {
        for (auto& word : words)
        {
            if (!word.empty())
                OPENSSL_cleanse(&word[0], word.size());
        }
    }
}
