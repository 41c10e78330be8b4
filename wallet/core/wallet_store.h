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

#include "wallet_db.h"
#include "wallet_record.h"
#include "utility/shared_data.h"

#include <boost/optional.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace warden::wallet
{
    /// Wallet name -> encrypted record, behind one reader-writer lock.
    /// Every mutation is written to storage before it becomes visible in the map.
    class WalletStore
    {
    public:
        explicit WalletStore(IWalletStorage::Ptr storage);

        // replaces the map with what storage holds
        void load();

        // throws AlreadyExists if the name is taken
        void insert(const WalletRecord& record);
        // throws NotFound
        void update(const WalletRecord& record);
        // called for each (network, address) of a removed wallet that no other wallet caches
        using AddressReleaser = std::function<void(const std::string& network, const std::string& address)>;

        // throws NotFound, returns the removed record.
        // releaser runs under the write lock, so no wallet sharing the address can appear meanwhile
        WalletRecord remove(const std::string& name, const AddressReleaser& releaser = {});

        boost::optional<WalletRecord> find(const std::string& name) const;
        // throws NotFound
        WalletRecord get(const std::string& name) const;
        bool contains(const std::string& name) const;

        // sorted by name
        std::vector<WalletSummary> list() const;
        size_t size() const;

    private:
        using WalletMap = std::map<std::string, WalletRecord>;

        IWalletStorage::Ptr m_storage;
        SharedData<WalletMap> m_wallets;
    };
} // namespace warden::wallet
