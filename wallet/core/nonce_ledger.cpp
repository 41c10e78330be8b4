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

#include "nonce_ledger.h"
#include "common.h"

#include "utility/logger.h"

#include <algorithm>
#include <limits>

namespace warden::wallet
{
    namespace
    {
        [[noreturn]] void ThrowOverflow(const std::string& network, const std::string& address)
        {
            throw WalletException(ErrorCode::NonceOverflow, "nonce overflow for " + network + ":" + address);
        }

        [[noreturn]] void ThrowCapacityFull(const std::string& network, const std::string& address)
        {
            throw WalletException(ErrorCode::CapacityFull, "nonce counter is full for " + network + ":" + address);
        }
    }

    uint64_t InMemoryNonceTracker::reserve(const std::string& network, const std::string& address)
    {
        auto next = m_next.write();
        auto& value = (*next)[std::make_tuple(address, network)];
        if (value == std::numeric_limits<uint64_t>::max())
        {
            ThrowOverflow(network, address);
        }
        return value++;
    }

    void InMemoryNonceTracker::markUsed(const std::string& network, const std::string& address, uint64_t used)
    {
        if (used == std::numeric_limits<uint64_t>::max())
        {
            ThrowOverflow(network, address);
        }
        auto next = m_next.write();
        auto& value = (*next)[std::make_tuple(address, network)];
        value = std::max(value, used + 1);
    }

    boost::optional<uint64_t> InMemoryNonceTracker::peek(const std::string& network, const std::string& address) const
    {
        auto next = m_next.read();
        auto it = next->find(std::make_tuple(address, network));
        if (it == next->end())
        {
            return {};
        }
        return it->second;
    }

    void InMemoryNonceTracker::remove(const std::string& network, const std::string& address)
    {
        m_next.write()->erase(std::make_tuple(address, network));
    }

    NonceLedger::NonceLedger(IWalletStorage::Ptr storage)
        : m_storage(std::move(storage))
    {
    }

    uint64_t NonceLedger::reserve(const std::string& network, const std::string& address)
    {
        try
        {
            return m_storage->reserveNonce(network, address, 0);
        }
        catch (const NonceCapacityException&)
        {
            ThrowCapacityFull(network, address);
        }
        catch (const DatabaseException&)
        {
            throw WalletException(ErrorCode::StorageError, "nonce reservation failed");
        }
    }

    void NonceLedger::markUsed(const std::string& network, const std::string& address, uint64_t used)
    {
        try
        {
            m_storage->markNonceUsed(network, address, used);
        }
        catch (const NonceCapacityException&)
        {
            ThrowCapacityFull(network, address);
        }
        catch (const DatabaseException&)
        {
            throw WalletException(ErrorCode::StorageError, "nonce update failed");
        }
        m_tracker.markUsed(network, address, used);
    }

    boost::optional<uint64_t> NonceLedger::getNext(const std::string& network, const std::string& address) const
    {
        try
        {
            return m_storage->getNextNonce(network, address);
        }
        catch (const DatabaseException&)
        {
            throw WalletException(ErrorCode::StorageError, "nonce lookup failed");
        }
    }

    uint64_t NonceLedger::reserveLocal(const std::string& network, const std::string& address)
    {
        return m_tracker.reserve(network, address);
    }

    void NonceLedger::purge(const std::string& network, const std::string& address)
    {
        m_tracker.remove(network, address);
        try
        {
            m_storage->deleteNonces(network, address);
        }
        catch (const DatabaseException&)
        {
            throw WalletException(ErrorCode::StorageError, "nonce purge failed");
        }
        LOG_DEBUG() << "Nonce entries purged for " << network << ":" << address;
    }
} // namespace warden::wallet
