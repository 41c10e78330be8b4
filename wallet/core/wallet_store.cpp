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

#include "wallet_store.h"
#include "common.h"
#include "sanitizer.h"

#include "utility/logger.h"

namespace warden::wallet
{
    namespace
    {
        [[noreturn]] void ThrowNotFound(const std::string& name)
        {
            throw WalletException(ErrorCode::NotFound, "wallet not found: " + name);
        }

        template <typename Func>
        auto Persist(Func&& func) -> decltype(func())
        {
            try
            {
                return func();
            }
            catch (const DatabaseException& ex)
            {
                LOG_ERROR() << "Storage failure: " << SanitizeForLog(ex.what());
                throw WalletException(ErrorCode::StorageError, "storage failure");
            }
        }
    }

    WalletStore::WalletStore(IWalletStorage::Ptr storage)
        : m_storage(std::move(storage))
    {
    }

    void WalletStore::load()
    {
        auto records = Persist([this]() { return m_storage->loadWallets(); });

        WalletMap loaded;
        for (auto& record : records)
        {
            auto name = record.m_name;
            loaded.emplace(std::move(name), std::move(record));
        }

        auto wallets = m_wallets.write();
        wallets->swap(loaded);
        LOG_INFO() << "Loaded " << wallets->size() << " wallet(s)";
    }

    void WalletStore::insert(const WalletRecord& record)
    {
        auto wallets = m_wallets.write();
        if (wallets->count(record.m_name))
        {
            throw WalletException(ErrorCode::AlreadyExists, "wallet already exists: " + record.m_name);
        }
        Persist([&]() { m_storage->saveWallet(record); });
        wallets->emplace(record.m_name, record);
    }

    void WalletStore::update(const WalletRecord& record)
    {
        auto wallets = m_wallets.write();
        auto it = wallets->find(record.m_name);
        if (it == wallets->end() || it->second.m_id != record.m_id)
        {
            ThrowNotFound(record.m_name);
        }
        Persist([&]() { m_storage->saveWallet(record); });
        it->second = record;
    }

    WalletRecord WalletStore::remove(const std::string& name, const AddressReleaser& releaser)
    {
        auto wallets = m_wallets.write();
        auto it = wallets->find(name);
        if (it == wallets->end())
        {
            ThrowNotFound(name);
        }
        Persist([&]() { m_storage->deleteWallet(name); });
        WalletRecord removed = std::move(it->second);
        wallets->erase(it);

        if (releaser)
        {
            for (const auto& [network, address] : removed.m_addresses)
            {
                bool shared = false;
                for (const auto& p : *wallets)
                {
                    auto other = p.second.m_addresses.find(network);
                    if (other != p.second.m_addresses.end() && other->second == address)
                    {
                        shared = true;
                        break;
                    }
                }
                if (!shared)
                {
                    releaser(network, address);
                }
            }
        }
        return removed;
    }

    boost::optional<WalletRecord> WalletStore::find(const std::string& name) const
    {
        auto wallets = m_wallets.read();
        auto it = wallets->find(name);
        if (it == wallets->end())
        {
            return {};
        }
        return it->second;
    }

    WalletRecord WalletStore::get(const std::string& name) const
    {
        auto record = find(name);
        if (!record)
        {
            ThrowNotFound(name);
        }
        return *record;
    }

    bool WalletStore::contains(const std::string& name) const
    {
        return m_wallets.read()->count(name) != 0;
    }

    std::vector<WalletSummary> WalletStore::list() const
    {
        std::vector<WalletSummary> res;
        auto wallets = m_wallets.read();
        res.reserve(wallets->size());
        for (const auto& p : *wallets)
        {
            res.push_back(MakeSummary(p.second));
        }
        return res;
    }

    size_t WalletStore::size() const
    {
        return m_wallets.read()->size();
    }
} // namespace warden::wallet
