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
#include "secure_buffer.h"
#include "utility/common.h"
#include <map>
#include <stdexcept>
#include <string>

namespace warden::crypto
{
    constexpr size_t kKeySize = 32;
    constexpr size_t kSaltSize = 32;
    constexpr size_t kNonceSize = 12;
    constexpr size_t kTagSize = 16;

    constexpr uint32_t kSchemaV1 = 1; // AAD = wallet name
    constexpr uint32_t kSchemaV2 = 2; // AAD = tag + wallet id
    constexpr uint32_t kLatestSchema = kSchemaV2;

    extern const char kAadV2Tag[];

    /// Always carries the same text so callers cannot tell a bad key from corrupted data
    class CryptoException : public std::runtime_error
    {
    public:
        CryptoException()
            : std::runtime_error("cryptographic operation failed")
        {
        }
    };

    enum class Cipher
    {
        Aes256Gcm,
        ChaCha20Poly1305
    };

    struct WalletIdentity
    {
        std::string m_id;
        std::string m_name;
    };

    /// Encrypted master key and everything except the root key needed to open it
    struct Envelope
    {
        ByteBuffer m_ciphertext; // tag appended
        ByteBuffer m_salt;
        ByteBuffer m_nonce;
        uint32_t m_schemaVersion = kLatestSchema;
        bool m_quantumSafe = false;
        std::string m_kekId;
    };

    ByteBuffer BuildAad(const WalletIdentity& identity, uint32_t schemaVersion);
    ByteBuffer BuildHkdfInfo(const WalletIdentity& identity, uint32_t schemaVersion);

    // HKDF-SHA256
    SecureBuffer DeriveKey(const SecureBuffer& ikm, const ByteBuffer& salt, const ByteBuffer& info, size_t size = kKeySize);

    ByteBuffer AeadEncrypt(Cipher cipher, const SecureBuffer& key, const ByteBuffer& nonce, const ByteBuffer& aad, const uint8_t* plain, size_t size);
    SecureBuffer AeadDecrypt(Cipher cipher, const SecureBuffer& key, const ByteBuffer& nonce, const ByteBuffer& aad, const ByteBuffer& ciphertext);

    /// 256-bit root key-encryption key. Never derived from a user password.
    class RootKek
    {
    public:
        // text is base64 or hex of exactly 32 bytes
        static RootKek fromEncoded(const std::string& text, const std::string& id, bool testMode);
        static RootKek fromEnvironment(const std::string& variable, const std::string& id, bool testMode);

        RootKek(RootKek&&) = default;
        RootKek& operator=(RootKek&&) = default;

        const std::string& id() const { return m_id; }
        const SecureBuffer& key() const { return m_key; }

    private:
        RootKek(SecureBuffer&& key, const std::string& id);

        SecureBuffer m_key;
        std::string m_id;
    };

    /// Set of root keys known to this process, one of them is current and used for new writes
    class KekRing
    {
    public:
        void add(RootKek&& kek, bool makeCurrent = true);
        const RootKek& current() const;
        const RootKek* find(const std::string& id) const;
        bool empty() const { return m_keys.empty(); }

    private:
        std::map<std::string, RootKek> m_keys;
        std::string m_currentId;
    };

    class EnvelopeCrypto
    {
    public:
        explicit EnvelopeCrypto(const KekRing& keks);

        /// Always writes the latest schema
        Envelope encryptMasterKey(const SecureBuffer& masterKey, const WalletIdentity& identity, bool quantumSafe) const;

        /// Rebuilds AAD for the declared schema, falls back once to the previous schema
        SecureBuffer decryptMasterKey(const Envelope& envelope, const WalletIdentity& identity) const;

        const std::string& currentKekId() const;

    private:
        SecureBuffer decryptWithSchema(const Envelope& envelope, const WalletIdentity& identity, uint32_t schemaVersion) const;
        const RootKek& selectKek(const std::string& kekId) const;

        const KekRing& m_keks;
    };

    ByteBuffer DecodeBase64(const std::string& text, bool& isValid);
    std::string EncodeBase64(const uint8_t* p, size_t size);
}
