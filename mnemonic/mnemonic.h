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

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace warden
{
    class MnemonicException : public std::runtime_error {
    public:
        explicit MnemonicException(const std::string& msg)
            : std::runtime_error(msg.c_str())
        {
        }

        explicit MnemonicException(const char *msg)
            : std::runtime_error(msg)
        {
        }
    };

    typedef std::vector<std::string> WordList;

    // 32 bytes of entropy give 24 words
    const size_t kDefaultEntropySize = 32;

    std::vector<uint8_t> getEntropy(size_t size = kDefaultEntropySize);

    // BIP-39, English word list, entropy of 16, 20, 24, 28 or 32 bytes
    WordList createMnemonic(const std::vector<uint8_t>& entropy);

    // BIP-39 seed (64 bytes) with the empty passphrase
    std::vector<uint8_t> decodeMnemonic(const WordList& words);

    bool isAllowedWordCount(size_t count);
    bool isValidMnemonic(const WordList& words);

    // splits on whitespace, lowercases
    WordList parseMnemonic(const std::string& phrase);

    // overwrites every word with zeros in place, sizes are kept
    void wipeMnemonic(WordList& words);
}
