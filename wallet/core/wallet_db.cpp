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

#include "wallet_db.h"
#include "common.h"

#include "utility/helpers.h"
#include "utility/logger.h"

#include <sqlite3.h>

#include <limits>
#include <sstream>

namespace warden::wallet
{
    using namespace std;

    namespace
    {
        const int BusyTimeoutMs = 5000;
        const int64_t MaxStoredNonce = numeric_limits<int64_t>::max();

        void throwIfError(int res, sqlite3* db)
        {
            if (res == SQLITE_OK)
            {
                return;
            }
            stringstream ss;
            ss << "sqlite error code=" << res << ", " << sqlite3_errmsg(db);
            if (res == SQLITE_NOTADB)
            {
                throw FileIsNotDatabaseException();
            }
            throw DatabaseException(ss.str());
        }
    }

    namespace sqlite
    {
        struct Statement
        {
            Statement(sqlite3* db, const char* sql)
                : _db(db)
                , _stm(nullptr)
            {
                int ret = sqlite3_prepare_v2(_db, sql, -1, &_stm, nullptr);
                throwIfError(ret, _db);
            }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind(int col, int val)
            {
                int ret = sqlite3_bind_int(_stm, col, val);
                throwIfError(ret, _db);
            }

            void bind(int col, bool val)
            {
                bind(col, val ? 1 : 0);
            }

            void bind(int col, uint32_t val)
            {
                int ret = sqlite3_bind_int64(_stm, col, static_cast<sqlite3_int64>(val));
                throwIfError(ret, _db);
            }

            void bind(int col, uint64_t val)
            {
                int ret = sqlite3_bind_int64(_stm, col, static_cast<sqlite3_int64>(val));
                throwIfError(ret, _db);
            }

            void bind(int col, const string& val) // utf-8
            {
                if (val.size() > static_cast<size_t>(numeric_limits<int32_t>::max()))
                {
                    throwIfError(SQLITE_TOOBIG, _db);
                }
                int ret = sqlite3_bind_text(_stm, col, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT);
                throwIfError(ret, _db);
            }

            bool step()
            {
                int ret = sqlite3_step(_stm);
                switch (ret)
                {
                case SQLITE_ROW: return true;   // has another row ready continue
                case SQLITE_DONE: return false; // has finished executing stop;
                default:
                    throwIfError(ret, _db);
                    return false; // and stop
                }
            }

            void get(int col, uint64_t& val)
            {
                val = static_cast<uint64_t>(sqlite3_column_int64(_stm, col));
            }

            void get(int col, uint32_t& val)
            {
                val = static_cast<uint32_t>(sqlite3_column_int64(_stm, col));
            }

            void get(int col, bool& val)
            {
                val = sqlite3_column_int(_stm, col) == 0 ? false : true;
            }

            void get(int col, string& str) // utf-8
            {
                str.clear();
                int size = sqlite3_column_bytes(_stm, col);
                if (size > 0)
                {
                    const unsigned char* data = sqlite3_column_text(_stm, col);
                    str.assign(reinterpret_cast<const string::value_type*>(data), size);
                }
            }

            ~Statement()
            {
                sqlite3_finalize(_stm);
            }
        private:
            sqlite3 * _db;
            sqlite3_stmt* _stm;
        };

        struct Transaction
        {
            Transaction(sqlite3* db)
                : _db(db)
                , _commited(false)
                , _rollbacked(false)
            {
                begin();
            }

            ~Transaction()
            {
                if (!_commited && !_rollbacked)
                    rollback();
            }

            void begin()
            {
                int ret = sqlite3_exec(_db, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr);
                throwIfError(ret, _db);
            }

            void commit()
            {
                int ret = sqlite3_exec(_db, "COMMIT;", nullptr, nullptr, nullptr);
                throwIfError(ret, _db);
                _commited = true;
            }

            void rollback() noexcept
            {
                int ret = sqlite3_exec(_db, "ROLLBACK;", nullptr, nullptr, nullptr);
                _rollbacked = (ret == SQLITE_OK);
            }
        private:
            sqlite3 * _db;
            bool _commited;
            bool _rollbacked;
        };
    }

    namespace
    {
        const char* WalletsTable =
            "CREATE TABLE IF NOT EXISTS wallets ("
            "id TEXT PRIMARY KEY NOT NULL, "
            "name TEXT NOT NULL UNIQUE, "
            "encryptedData TEXT NOT NULL, "
            "quantumSafe INTEGER NOT NULL DEFAULT 0, "
            "createdAt INTEGER NOT NULL, "
            "updatedAt INTEGER NOT NULL);";

        const char* NoncesTable =
            "CREATE TABLE IF NOT EXISTS nonces ("
            "network TEXT NOT NULL, "
            "address TEXT NOT NULL, "
            "nextNonce INTEGER NOT NULL, "
            "updatedAt INTEGER NOT NULL, "
            "UNIQUE(network, address));";

        const char* KeyLabelsTable =
            "CREATE TABLE IF NOT EXISTS key_labels ("
            "label TEXT PRIMARY KEY NOT NULL, "
            "currentVersion INTEGER NOT NULL, "
            "currentId TEXT NOT NULL);";

        const char* KeyVersionsTable =
            "CREATE TABLE IF NOT EXISTS key_versions ("
            "label TEXT NOT NULL, "
            "version INTEGER NOT NULL, "
            "keyId TEXT NOT NULL, "
            "retired INTEGER NOT NULL DEFAULT 0, "
            "usageCount INTEGER NOT NULL DEFAULT 0, "
            "createdAt INTEGER NOT NULL, "
            "PRIMARY KEY(label, version));";

        void insertKeyVersion(sqlite3* db, const KeyVersion& v)
        {
            const char* req = "INSERT INTO key_versions (label, version, keyId, retired, usageCount, createdAt) VALUES(?1, ?2, ?3, ?4, ?5, ?6);";
            sqlite::Statement stm(db, req);
            stm.bind(1, v.m_label);
            stm.bind(2, v.m_version);
            stm.bind(3, v.m_keyId);
            stm.bind(4, v.m_retired);
            stm.bind(5, v.m_usageCount);
            stm.bind(6, v.m_createdAt);
            stm.step();
        }
    }

    ///////////////////////////////////////////////////////////////////////////
    // MemoryWalletStorage

    void MemoryWalletStorage::saveWallet(const WalletRecord& record)
    {
        lock_guard<mutex> lock(m_mutex);
        for (const auto& p : m_wallets)
        {
            if (p.second.m_name == record.m_name && p.first != record.m_id)
            {
                throw DatabaseException("wallet name is not unique");
            }
        }
        m_wallets[record.m_id] = record;
    }

    vector<WalletRecord> MemoryWalletStorage::loadWallets()
    {
        lock_guard<mutex> lock(m_mutex);
        vector<WalletRecord> res;
        res.reserve(m_wallets.size());
        for (const auto& p : m_wallets)
        {
            res.push_back(p.second);
        }
        return res;
    }

    bool MemoryWalletStorage::deleteWallet(const string& name)
    {
        lock_guard<mutex> lock(m_mutex);
        for (auto it = m_wallets.begin(); it != m_wallets.end(); ++it)
        {
            if (it->second.m_name == name)
            {
                m_wallets.erase(it);
                return true;
            }
        }
        return false;
    }

    uint64_t MemoryWalletStorage::reserveNonce(const string& network, const string& address, uint64_t seed)
    {
        lock_guard<mutex> lock(m_mutex);
        auto key = make_tuple(network, address);
        auto it = m_nonces.find(key);
        if (it == m_nonces.end())
        {
            if (seed == numeric_limits<uint64_t>::max())
            {
                throw NonceCapacityException();
            }
            m_nonces.emplace(key, seed + 1);
            return seed;
        }
        if (it->second == numeric_limits<uint64_t>::max())
        {
            throw NonceCapacityException();
        }
        return it->second++;
    }

    void MemoryWalletStorage::markNonceUsed(const string& network, const string& address, uint64_t used)
    {
        if (used == numeric_limits<uint64_t>::max())
        {
            throw NonceCapacityException();
        }
        lock_guard<mutex> lock(m_mutex);
        auto& value = m_nonces[make_tuple(network, address)];
        value = std::max(value, used + 1);
    }

    boost::optional<uint64_t> MemoryWalletStorage::getNextNonce(const string& network, const string& address)
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_nonces.find(make_tuple(network, address));
        if (it == m_nonces.end())
        {
            return {};
        }
        return it->second;
    }

    void MemoryWalletStorage::deleteNonces(const string& network, const string& address)
    {
        lock_guard<mutex> lock(m_mutex);
        m_nonces.erase(make_tuple(network, address));
    }

    boost::optional<KeyLabel> MemoryWalletStorage::getKeyLabel(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_labels.find(label);
        if (it == m_labels.end())
        {
            return {};
        }
        return it->second;
    }

    vector<KeyVersion> MemoryWalletStorage::getKeyVersions(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        vector<KeyVersion> res;
        for (auto it = m_versions.lower_bound(make_tuple(label, 0u)); it != m_versions.end() && get<0>(it->first) == label; ++it)
        {
            res.push_back(it->second);
        }
        return res;
    }

    bool MemoryWalletStorage::insertKeyLabel(const KeyVersion& first)
    {
        lock_guard<mutex> lock(m_mutex);
        if (m_labels.count(first.m_label))
        {
            return false;
        }
        m_labels[first.m_label] = KeyLabel{ first.m_label, first.m_version, first.m_keyId };
        m_versions[make_tuple(first.m_label, first.m_version)] = first;
        return true;
    }

    bool MemoryWalletStorage::rotateKey(const KeyVersion& next)
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_labels.find(next.m_label);
        if (it == m_labels.end() || it->second.m_currentVersion + 1 != next.m_version)
        {
            return false;
        }
        auto current = m_versions.find(make_tuple(next.m_label, it->second.m_currentVersion));
        if (current != m_versions.end())
        {
            current->second.m_retired = true;
        }
        m_versions[make_tuple(next.m_label, next.m_version)] = next;
        it->second.m_currentVersion = next.m_version;
        it->second.m_currentId = next.m_keyId;
        return true;
    }

    bool MemoryWalletStorage::incrementKeyUsage(const string& label, uint32_t version)
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_versions.find(make_tuple(label, version));
        if (it == m_versions.end() || it->second.m_retired)
        {
            return false;
        }
        ++it->second.m_usageCount;
        return true;
    }

    void MemoryWalletStorage::deleteKeyLabel(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        m_labels.erase(label);
        for (auto it = m_versions.lower_bound(make_tuple(label, 0u)); it != m_versions.end() && get<0>(it->first) == label; )
        {
            it = m_versions.erase(it);
        }
    }

    ///////////////////////////////////////////////////////////////////////////
    // SqliteWalletStorage

    SqliteWalletStorage::Ptr SqliteWalletStorage::open(const string& path)
    {
        sqlite3* db = nullptr;
        int ret = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (ret != SQLITE_OK)
        {
            stringstream ss;
            ss << "sqlite error code=" << ret << ", cannot open " << path;
            sqlite3_close(db);
            throw DatabaseException(ss.str());
        }

        Ptr storage(new SqliteWalletStorage(db));
        ret = sqlite3_busy_timeout(db, BusyTimeoutMs);
        throwIfError(ret, db);
        storage->createTables();

        LOG_INFO() << "Wallet storage opened";
        return storage;
    }

    SqliteWalletStorage::SqliteWalletStorage(sqlite3* db)
        : _db(db)
    {
    }

    SqliteWalletStorage::~SqliteWalletStorage()
    {
        if (_db)
        {
            WARDEN_VERIFY(SQLITE_OK == sqlite3_close(_db));
            _db = nullptr;
        }
    }

    void SqliteWalletStorage::createTables()
    {
        for (const char* req : { WalletsTable, NoncesTable, KeyLabelsTable, KeyVersionsTable })
        {
            int ret = sqlite3_exec(_db, req, nullptr, nullptr, nullptr);
            throwIfError(ret, _db);
        }
    }

    void SqliteWalletStorage::saveWallet(const WalletRecord& record)
    {
        lock_guard<mutex> lock(m_mutex);
        const char* req =
            "INSERT INTO wallets (id, name, encryptedData, quantumSafe, createdAt, updatedAt) VALUES(?1, ?2, ?3, ?4, ?5, ?6) "
            "ON CONFLICT(id) DO UPDATE SET encryptedData = excluded.encryptedData, quantumSafe = excluded.quantumSafe, updatedAt = excluded.updatedAt;";
        sqlite::Statement stm(_db, req);
        stm.bind(1, record.m_id);
        stm.bind(2, record.m_name);
        stm.bind(3, record.serializeEncryptedData());
        stm.bind(4, record.m_quantumSafe);
        stm.bind(5, record.m_createdAt);
        stm.bind(6, record.m_updatedAt);
        stm.step();
    }

    vector<WalletRecord> SqliteWalletStorage::loadWallets()
    {
        lock_guard<mutex> lock(m_mutex);
        vector<WalletRecord> res;
        const char* req = "SELECT id, name, encryptedData, quantumSafe, createdAt, updatedAt FROM wallets ORDER BY name;";
        sqlite::Statement stm(_db, req);
        while (stm.step())
        {
            WalletRecord record;
            string encryptedData;
            stm.get(0, record.m_id);
            stm.get(1, record.m_name);
            stm.get(2, encryptedData);
            stm.get(3, record.m_quantumSafe);
            stm.get(4, record.m_createdAt);
            stm.get(5, record.m_updatedAt);
            record.deserializeEncryptedData(encryptedData);
            res.push_back(std::move(record));
        }
        return res;
    }

    bool SqliteWalletStorage::deleteWallet(const string& name)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Statement stm(_db, "DELETE FROM wallets WHERE name = ?1;");
        stm.bind(1, name);
        stm.step();
        return sqlite3_changes(_db) > 0;
    }

    uint64_t SqliteWalletStorage::reserveNonce(const string& network, const string& address, uint64_t seed)
    {
        if (seed >= static_cast<uint64_t>(MaxStoredNonce))
        {
            throw NonceCapacityException();
        }

        lock_guard<mutex> lock(m_mutex);
        sqlite::Transaction trans(_db);
        {
            const char* req =
                "INSERT INTO nonces (network, address, nextNonce, updatedAt) VALUES(?1, ?2, ?3, ?4) "
                "ON CONFLICT(network, address) DO UPDATE SET nextNonce = nextNonce + 1, updatedAt = excluded.updatedAt "
                "WHERE nextNonce < 9223372036854775807;";
            sqlite::Statement stm(_db, req);
            stm.bind(1, network);
            stm.bind(2, address);
            stm.bind(3, seed + 1);
            stm.bind(4, unix_timestamp_sec());
            stm.step();
        }
        if (sqlite3_changes(_db) == 0)
        {
            throw NonceCapacityException();
        }

        uint64_t next = 0;
        {
            sqlite::Statement stm(_db, "SELECT nextNonce FROM nonces WHERE network = ?1 AND address = ?2;");
            stm.bind(1, network);
            stm.bind(2, address);
            if (!stm.step())
            {
                throw DatabaseException("nonce row is missing after upsert");
            }
            stm.get(0, next);
        }
        trans.commit();
        return next - 1;
    }

    void SqliteWalletStorage::markNonceUsed(const string& network, const string& address, uint64_t used)
    {
        if (used >= static_cast<uint64_t>(MaxStoredNonce))
        {
            throw NonceCapacityException();
        }

        lock_guard<mutex> lock(m_mutex);
        const char* req =
            "INSERT INTO nonces (network, address, nextNonce, updatedAt) VALUES(?1, ?2, ?3, ?4) "
            "ON CONFLICT(network, address) DO UPDATE SET nextNonce = MAX(nextNonce, excluded.nextNonce), updatedAt = excluded.updatedAt;";
        sqlite::Statement stm(_db, req);
        stm.bind(1, network);
        stm.bind(2, address);
        stm.bind(3, used + 1);
        stm.bind(4, unix_timestamp_sec());
        stm.step();
    }

    boost::optional<uint64_t> SqliteWalletStorage::getNextNonce(const string& network, const string& address)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Statement stm(_db, "SELECT nextNonce FROM nonces WHERE network = ?1 AND address = ?2;");
        stm.bind(1, network);
        stm.bind(2, address);
        if (!stm.step())
        {
            return {};
        }
        uint64_t next = 0;
        stm.get(0, next);
        return next;
    }

    void SqliteWalletStorage::deleteNonces(const string& network, const string& address)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Statement stm(_db, "DELETE FROM nonces WHERE network = ?1 AND address = ?2;");
        stm.bind(1, network);
        stm.bind(2, address);
        stm.step();
    }

    boost::optional<KeyLabel> SqliteWalletStorage::getKeyLabel(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Statement stm(_db, "SELECT label, currentVersion, currentId FROM key_labels WHERE label = ?1;");
        stm.bind(1, label);
        if (!stm.step())
        {
            return {};
        }
        KeyLabel res;
        stm.get(0, res.m_label);
        stm.get(1, res.m_currentVersion);
        stm.get(2, res.m_currentId);
        return res;
    }

    vector<KeyVersion> SqliteWalletStorage::getKeyVersions(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        vector<KeyVersion> res;
        const char* req = "SELECT label, version, keyId, retired, usageCount, createdAt FROM key_versions WHERE label = ?1 ORDER BY version;";
        sqlite::Statement stm(_db, req);
        stm.bind(1, label);
        while (stm.step())
        {
            KeyVersion v;
            stm.get(0, v.m_label);
            stm.get(1, v.m_version);
            stm.get(2, v.m_keyId);
            stm.get(3, v.m_retired);
            stm.get(4, v.m_usageCount);
            stm.get(5, v.m_createdAt);
            res.push_back(std::move(v));
        }
        return res;
    }

    bool SqliteWalletStorage::insertKeyLabel(const KeyVersion& first)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Transaction trans(_db);
        {
            sqlite::Statement stm(_db, "INSERT OR IGNORE INTO key_labels (label, currentVersion, currentId) VALUES(?1, ?2, ?3);");
            stm.bind(1, first.m_label);
            stm.bind(2, first.m_version);
            stm.bind(3, first.m_keyId);
            stm.step();
        }
        if (sqlite3_changes(_db) == 0)
        {
            return false;
        }
        insertKeyVersion(_db, first);
        trans.commit();
        return true;
    }

    bool SqliteWalletStorage::rotateKey(const KeyVersion& next)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Transaction trans(_db);
        {
            const char* req = "UPDATE key_labels SET currentVersion = ?2, currentId = ?3 WHERE label = ?1 AND currentVersion = ?4;";
            sqlite::Statement stm(_db, req);
            stm.bind(1, next.m_label);
            stm.bind(2, next.m_version);
            stm.bind(3, next.m_keyId);
            stm.bind(4, next.m_version - 1);
            stm.step();
        }
        if (sqlite3_changes(_db) == 0)
        {
            return false;
        }
        {
            sqlite::Statement stm(_db, "UPDATE key_versions SET retired = 1 WHERE label = ?1 AND version = ?2;");
            stm.bind(1, next.m_label);
            stm.bind(2, next.m_version - 1);
            stm.step();
        }
        insertKeyVersion(_db, next);
        trans.commit();
        return true;
    }

    bool SqliteWalletStorage::incrementKeyUsage(const string& label, uint32_t version)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Statement stm(_db, "UPDATE key_versions SET usageCount = usageCount + 1 WHERE label = ?1 AND version = ?2 AND retired = 0;");
        stm.bind(1, label);
        stm.bind(2, version);
        stm.step();
        return sqlite3_changes(_db) > 0;
    }

    void SqliteWalletStorage::deleteKeyLabel(const string& label)
    {
        lock_guard<mutex> lock(m_mutex);
        sqlite::Transaction trans(_db);
        {
            sqlite::Statement stm(_db, "DELETE FROM key_versions WHERE label = ?1;");
            stm.bind(1, label);
            stm.step();
        }
        {
            sqlite::Statement stm(_db, "DELETE FROM key_labels WHERE label = ?1;");
            stm.bind(1, label);
            stm.step();
        }
        trans.commit();
    }
} // namespace warden::wallet
