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
#include "utility/shared_data.h"

#include <boost/optional.hpp>
#include <map>
#include <string>
#include <tuple>

namespace warden::wallet
{
    /// Per-process advisory sequence, no guarantee across processes
    class InMemoryNonceTracker
    {
    public:
        // returns the next value and increments it, throws NonceOverflow instead of wrapping
        uint64_t reserve(const std::string& network, const std::string& address);
        void markUsed(const std::string& network, const std::string& address, uint64_t used);
        boost::optional<uint64_t> peek(const std::string& network, const std::string& address) const;
        void remove(const std::string& network, const std::string& address);

    private:
        using Key = std::tuple<std::string, std::string>; // address, network
        SharedData<std::map<Key, uint64_t>> m_next;
    };

    /// Two independent tiers: the in-memory tracker and the persisted counter,
    /// the latter being the authority when several processes share storage
    class NonceLedger
    {
    public:
        explicit NonceLedger(IWalletStorage::Ptr storage);

        // persisted tier, one atomic statement per reservation
        uint64_t reserve(const std::string& network, const std::string& address);
        // raises both tiers to at least used + 1, never lowers them
        void markUsed(const std::string& network, const std::string& address, uint64_t used);
        boost::optional<uint64_t> getNext(const std::string& network, const std::string& address) const;

        // in-memory tier
        uint64_t reserveLocal(const std::string& network, const std::string& address);

        // removes the entries of both tiers
        void purge(const std::string& network, const std::string& address);

        InMemoryNonceTracker& getTracker() { return m_tracker; }

    private:
        IWalletStorage::Ptr m_storage;
        InMemoryNonceTracker m_tracker;
    };
} // namespace warden::wallet
