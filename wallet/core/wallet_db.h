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

#include "wallet_record.h"

#include <boost/optional.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

struct sqlite3;

namespace warden::wallet
{
    class DatabaseException : public std::runtime_error
    {
    public:
        explicit DatabaseException(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    class FileIsNotDatabaseException : public DatabaseException
    {
    public:
        FileIsNotDatabaseException()
            : DatabaseException("")
        {
        }
    };

    // The stored counter reached the largest value the storage can hold
    class NonceCapacityException : public DatabaseException
    {
    public:
        NonceCapacityException()
            : DatabaseException("nonce counter is full")
        {
        }
    };

    struct KeyLabel
    {
        std::string m_label;
        uint32_t m_currentVersion = 0;
        std::string m_currentId;
    };

    struct KeyVersion
    {
        std::string m_label;
        uint32_t m_version = 0;
        std::string m_keyId;
        bool m_retired = false;
        uint64_t m_usageCount = 0;
        Timestamp m_createdAt = 0;
    };

    /// Persistence collaborator of the engine. Only ciphertext and non-secret
    /// metadata ever pass through it.
    class IWalletStorage
    {
    public:
        using Ptr = std::shared_ptr<IWalletStorage>;

        virtual ~IWalletStorage() = default;

        // wallets
        virtual void saveWallet(const WalletRecord& record) = 0; // insert or update by id
        virtual std::vector<WalletRecord> loadWallets() = 0;
        virtual bool deleteWallet(const std::string& name) = 0;

        // persisted nonce ledger
        // Atomically inserts seed + 1 or increments the stored value, returns the reserved value
        virtual uint64_t reserveNonce(const std::string& network, const std::string& address, uint64_t seed) = 0;
        // Raises the stored value to max(stored, used + 1)
        virtual void markNonceUsed(const std::string& network, const std::string& address, uint64_t used) = 0;
        virtual boost::optional<uint64_t> getNextNonce(const std::string& network, const std::string& address) = 0;
        virtual void deleteNonces(const std::string& network, const std::string& address) = 0;

        // key rotation registry
        virtual boost::optional<KeyLabel> getKeyLabel(const std::string& label) = 0;
        virtual std::vector<KeyVersion> getKeyVersions(const std::string& label) = 0;
        // Creates the label with its first version, returns false if the label exists
        virtual bool insertKeyLabel(const KeyVersion& first) = 0;
        // Inserts next, retires the previous current version and advances the pointer.
        // Returns false if the current version is not next.m_version - 1
        virtual bool rotateKey(const KeyVersion& next) = 0;
        virtual bool incrementKeyUsage(const std::string& label, uint32_t version) = 0;
        virtual void deleteKeyLabel(const std::string& label) = 0;
    };

    class MemoryWalletStorage : public IWalletStorage
    {
    public:
        void saveWallet(const WalletRecord& record) override;
        std::vector<WalletRecord> loadWallets() override;
        bool deleteWallet(const std::string& name) override;

        uint64_t reserveNonce(const std::string& network, const std::string& address, uint64_t seed) override;
        void markNonceUsed(const std::string& network, const std::string& address, uint64_t used) override;
        boost::optional<uint64_t> getNextNonce(const std::string& network, const std::string& address) override;
        void deleteNonces(const std::string& network, const std::string& address) override;

        boost::optional<KeyLabel> getKeyLabel(const std::string& label) override;
        std::vector<KeyVersion> getKeyVersions(const std::string& label) override;
        bool insertKeyLabel(const KeyVersion& first) override;
        bool rotateKey(const KeyVersion& next) override;
        bool incrementKeyUsage(const std::string& label, uint32_t version) override;
        void deleteKeyLabel(const std::string& label) override;

    private:
        using NonceKey = std::tuple<std::string, std::string>;
        using VersionKey = std::tuple<std::string, uint32_t>;

        std::mutex m_mutex;
        std::map<std::string, WalletRecord> m_wallets; // by id
        std::map<NonceKey, uint64_t> m_nonces;
        std::map<std::string, KeyLabel> m_labels;
        std::map<VersionKey, KeyVersion> m_versions;
    };

    class SqliteWalletStorage : public IWalletStorage
    {
    public:
        using Ptr = std::shared_ptr<SqliteWalletStorage>;

        // creates the file and the tables if they do not exist
        static Ptr open(const std::string& path);

        ~SqliteWalletStorage() override;

        void saveWallet(const WalletRecord& record) override;
        std::vector<WalletRecord> loadWallets() override;
        bool deleteWallet(const std::string& name) override;

        uint64_t reserveNonce(const std::string& network, const std::string& address, uint64_t seed) override;
        void markNonceUsed(const std::string& network, const std::string& address, uint64_t used) override;
        boost::optional<uint64_t> getNextNonce(const std::string& network, const std::string& address) override;
        void deleteNonces(const std::string& network, const std::string& address) override;

        boost::optional<KeyLabel> getKeyLabel(const std::string& label) override;
        std::vector<KeyVersion> getKeyVersions(const std::string& label) override;
        bool insertKeyLabel(const KeyVersion& first) override;
        bool rotateKey(const KeyVersion& next) override;
        bool incrementKeyUsage(const std::string& label, uint32_t version) override;
        void deleteKeyLabel(const std::string& label) override;

    private:
        explicit SqliteWalletStorage(sqlite3* db);
        void createTables();

        sqlite3* _db;
        std::mutex m_mutex;
    };
} // namespace warden::wallet
