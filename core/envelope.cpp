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

#include "envelope.h"
#include "utility/hex.h"
#include "utility/logger.h"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <boost/algorithm/string/trim.hpp>
#include <cstdlib>
#include <limits>

namespace warden::crypto
{
    const char kAadV2Tag[] = "WARDEN-AAD-V2";

    namespace
    {
        const char kHkdfInfoV1[] = "wallet-master-key";
        const char kHkdfInfoV2[] = "wallet-master-key-v2";

        struct CipherCtxDeleter
        {
            void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
        };
        using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

        struct PkeyCtxDeleter
        {
            void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
        };
        using PkeyCtx = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

        const EVP_CIPHER* GetEvpCipher(Cipher cipher)
        {
            switch (cipher)
            {
            case Cipher::ChaCha20Poly1305:
                return EVP_chacha20_poly1305();
            case Cipher::Aes256Gcm:
            default:
                return EVP_aes_256_gcm();
            }
        }

        int ToInt(size_t size)
        {
            if (size > static_cast<size_t>(std::numeric_limits<int>::max()))
                throw CryptoException();
            return static_cast<int>(size);
        }

        void Check(int ret)
        {
            if (ret != 1)
                throw CryptoException();
        }

        CipherCtx InitCipher(Cipher cipher, const SecureBuffer& key, const ByteBuffer& nonce, const ByteBuffer& aad, bool encrypt)
        {
            if (key.size() != kKeySize || nonce.size() != kNonceSize)
                throw CryptoException();

            CipherCtx ctx(EVP_CIPHER_CTX_new());
            if (!ctx)
                throw CryptoException();

            const int enc = encrypt ? 1 : 0;
            Check(EVP_CipherInit_ex(ctx.get(), GetEvpCipher(cipher), nullptr, nullptr, nullptr, enc));
            Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, ToInt(nonce.size()), nullptr));
            Check(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc));

            if (!aad.empty())
            {
                int outLen = 0;
                Check(EVP_CipherUpdate(ctx.get(), nullptr, &outLen, aad.data(), ToInt(aad.size())));
            }
            return ctx;
        }

        ByteBuffer ConcatInfo(const char* prefix, const ByteBuffer& aad)
        {
            ByteBuffer info(prefix, prefix + strlen(prefix));
            info.insert(info.end(), aad.begin(), aad.end());
            return info;
        }
    }

    ByteBuffer BuildAad(const WalletIdentity& identity, uint32_t schemaVersion)
    {
        switch (schemaVersion)
        {
        case kSchemaV1:
            return to_byte_buffer(identity.m_name);
        case kSchemaV2:
        {
            ByteBuffer aad(kAadV2Tag, kAadV2Tag + strlen(kAadV2Tag));
            aad.insert(aad.end(), identity.m_id.begin(), identity.m_id.end());
            return aad;
        }
        default:
            throw CryptoException();
        }
    }

    ByteBuffer BuildHkdfInfo(const WalletIdentity& identity, uint32_t schemaVersion)
    {
        return ConcatInfo(schemaVersion == kSchemaV1 ? kHkdfInfoV1 : kHkdfInfoV2, BuildAad(identity, schemaVersion));
    }

    SecureBuffer DeriveKey(const SecureBuffer& ikm, const ByteBuffer& salt, const ByteBuffer& info, size_t size)
    {
        if (ikm.empty())
            throw CryptoException();

        PkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
        if (!ctx)
            throw CryptoException();

        Check(EVP_PKEY_derive_init(ctx.get()));
        Check(EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()));
        Check(EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), ToInt(salt.size())));
        Check(EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), ToInt(ikm.size())));
        Check(EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), ToInt(info.size())));

        SecureBuffer out(size);
        size_t outLen = size;
        Check(EVP_PKEY_derive(ctx.get(), out.data(), &outLen));
        if (outLen != size)
            throw CryptoException();
        return out;
    }

    ByteBuffer AeadEncrypt(Cipher cipher, const SecureBuffer& key, const ByteBuffer& nonce, const ByteBuffer& aad, const uint8_t* plain, size_t size)
    {
        CipherCtx ctx = InitCipher(cipher, key, nonce, aad, true);

        ByteBuffer out(size + kTagSize);
        int len = 0;
        Check(EVP_EncryptUpdate(ctx.get(), out.data(), &len, plain, ToInt(size)));
        int total = len;
        Check(EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len));
        total += len;

        Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, ToInt(kTagSize), out.data() + total));
        out.resize(total + kTagSize);
        return out;
    }

    SecureBuffer AeadDecrypt(Cipher cipher, const SecureBuffer& key, const ByteBuffer& nonce, const ByteBuffer& aad, const ByteBuffer& ciphertext)
    {
        if (ciphertext.size() < kTagSize)
            throw CryptoException();

        const size_t bodySize = ciphertext.size() - kTagSize;
        CipherCtx ctx = InitCipher(cipher, key, nonce, aad, false);

        SecureBuffer out(bodySize + kTagSize);
        int len = 0;
        Check(EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(), ToInt(bodySize)));
        int total = len;

        ByteBuffer tag(ciphertext.end() - kTagSize, ciphertext.end());
        Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, ToInt(kTagSize), tag.data()));
        Check(EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len));
        total += len;

        return SecureBuffer(out.data(), static_cast<size_t>(total));
    }

    ByteBuffer DecodeBase64(const std::string& text, bool& isValid)
    {
        isValid = false;
        if (text.empty() || text.size() % 4 != 0)
            return {};

        ByteBuffer out(text.size() / 4 * 3);
        int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), ToInt(text.size()));
        if (len < 0)
            return {};

        // EVP_DecodeBlock keeps the padding bytes
        size_t padding = 0;
        if (text[text.size() - 1] == '=') ++padding;
        if (text[text.size() - 2] == '=') ++padding;
        out.resize(static_cast<size_t>(len) - padding);
        isValid = true;
        return out;
    }

    std::string EncodeBase64(const uint8_t* p, size_t size)
    {
        std::string out(4 * ((size + 2) / 3) + 1, '\0');
        int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), p, ToInt(size));
        out.resize(static_cast<size_t>(len));
        return out;
    }

    RootKek::RootKek(SecureBuffer&& key, const std::string& id)
        : m_key(std::move(key))
        , m_id(id)
    {
    }

    RootKek RootKek::fromEncoded(const std::string& encoded, const std::string& id, bool testMode)
    {
        std::string text = boost::algorithm::trim_copy(encoded);
        SecureBuffer key;

        bool isHex = false;
        if (text.size() == 2 * kKeySize)
        {
            ByteBuffer raw = from_hex(text, &isHex);
            if (isHex)
                key.assign(raw.data(), raw.size());
            SecureErase(raw.data(), raw.size());
        }

        if (!isHex)
        {
            bool isValid = false;
            ByteBuffer raw = DecodeBase64(text, isValid);
            if (isValid && raw.size() == kKeySize)
                key.assign(raw.data(), raw.size());
            SecureErase(raw.data(), raw.size());
        }
        SecureErase(&text[0], text.size());

        if (key.size() != kKeySize)
            throw std::invalid_argument("root key must encode exactly 32 bytes");

        if (key.isZero() && !testMode)
            throw std::invalid_argument("all-zero root key is allowed only in test mode");

        if (key.isZero())
        {
            LOG_WARNING() << "Using all-zero root key, test mode";
        }

        return RootKek(std::move(key), id);
    }

    RootKek RootKek::fromEnvironment(const std::string& variable, const std::string& id, bool testMode)
    {
        const char* value = std::getenv(variable.c_str());
        if (!value || !*value)
            throw std::invalid_argument("root key variable " + variable + " is not set");
        return fromEncoded(value, id, testMode);
    }

    void KekRing::add(RootKek&& kek, bool makeCurrent)
    {
        std::string id = kek.id();
        m_keys.erase(id);
        m_keys.emplace(id, std::move(kek));
        if (makeCurrent || m_currentId.empty())
            m_currentId = id;
    }

    const RootKek& KekRing::current() const
    {
        auto it = m_keys.find(m_currentId);
        if (it == m_keys.end())
            throw std::logic_error("no root key configured");
        return it->second;
    }

    const RootKek* KekRing::find(const std::string& id) const
    {
        auto it = m_keys.find(id);
        return it == m_keys.end() ? nullptr : &it->second;
    }

    EnvelopeCrypto::EnvelopeCrypto(const KekRing& keks)
        : m_keks(keks)
    {
    }

    const std::string& EnvelopeCrypto::currentKekId() const
    {
        return m_keks.current().id();
    }

    const RootKek& EnvelopeCrypto::selectKek(const std::string& kekId) const
    {
        if (kekId.empty())
            return m_keks.current();

        const RootKek* kek = m_keks.find(kekId);
        if (!kek)
            throw CryptoException();
        return *kek;
    }

    Envelope EnvelopeCrypto::encryptMasterKey(const SecureBuffer& masterKey, const WalletIdentity& identity, bool quantumSafe) const
    {
        if (masterKey.size() != kKeySize)
            throw CryptoException();

        const RootKek& kek = m_keks.current();

        Envelope envelope;
        envelope.m_schemaVersion = kLatestSchema;
        envelope.m_quantumSafe = quantumSafe;
        envelope.m_kekId = kek.id();
        envelope.m_salt.resize(kSaltSize);
        envelope.m_nonce.resize(kNonceSize);
        GenerateRandom(envelope.m_salt.data(), envelope.m_salt.size());
        GenerateRandom(envelope.m_nonce.data(), envelope.m_nonce.size());

        SecureBuffer dek = DeriveKey(kek.key(), envelope.m_salt, BuildHkdfInfo(identity, kLatestSchema));
        envelope.m_ciphertext = AeadEncrypt(
            quantumSafe ? Cipher::ChaCha20Poly1305 : Cipher::Aes256Gcm,
            dek,
            envelope.m_nonce,
            BuildAad(identity, kLatestSchema),
            masterKey.data(),
            masterKey.size());
        return envelope;
    }

    SecureBuffer EnvelopeCrypto::decryptWithSchema(const Envelope& envelope, const WalletIdentity& identity, uint32_t schemaVersion) const
    {
        const RootKek& kek = selectKek(envelope.m_kekId);
        SecureBuffer dek = DeriveKey(kek.key(), envelope.m_salt, BuildHkdfInfo(identity, schemaVersion));
        return AeadDecrypt(
            envelope.m_quantumSafe ? Cipher::ChaCha20Poly1305 : Cipher::Aes256Gcm,
            dek,
            envelope.m_nonce,
            BuildAad(identity, schemaVersion),
            envelope.m_ciphertext);
    }

    SecureBuffer EnvelopeCrypto::decryptMasterKey(const Envelope& envelope, const WalletIdentity& identity) const
    {
        if (envelope.m_salt.size() != kSaltSize || envelope.m_nonce.size() != kNonceSize)
            throw CryptoException();

        const uint32_t schema = envelope.m_schemaVersion;
        if (schema < kSchemaV1 || schema > kLatestSchema)
            throw CryptoException();

        try
        {
            SecureBuffer key = decryptWithSchema(envelope, identity, schema);
            if (key.size() != kKeySize)
                throw CryptoException();
            return key;
        }
        catch (const CryptoException&)
        {
            if (schema == kSchemaV1)
                throw;
        }

        LOG_DEBUG() << "Master key did not open under schema " << schema << ", trying schema " << schema - 1;
        SecureBuffer key = decryptWithSchema(envelope, identity, schema - 1);
        if (key.size() != kKeySize)
            throw CryptoException();
        return key;
    }
}
