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

#include "test_helpers.h"
#include "utility/logger.h"
#include "wallet/core/nonce_ledger.h"

#include <boost/filesystem.hpp>
#include <algorithm>
#include <limits>
#include <mutex>
#include <set>
#include <thread>

WALLET_TEST_INIT

using namespace warden;
using namespace warden::wallet;
using namespace std;

namespace
{
    const string kNetwork = "ethereum";
    const string kAddress = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";

    // every returned value must be in [0, N) exactly once
    template <typename Reserve>
    void CheckConcurrentReservations(Reserve&& reserve, size_t threadCount, size_t perThread)
    {
        mutex resultsMutex;
        vector<uint64_t> results;
        vector<thread> threads;
        for (size_t i = 0; i < threadCount; ++i)
        {
            threads.emplace_back([&]()
            {
                vector<uint64_t> local;
                for (size_t j = 0; j < perThread; ++j)
                {
                    local.push_back(reserve());
                }
                lock_guard<mutex> lock(resultsMutex);
                results.insert(results.end(), local.begin(), local.end());
            });
        }
        for (auto& t : threads)
        {
            t.join();
        }

        const size_t total = threadCount * perThread;
        WALLET_CHECK(results.size() == total);
        sort(results.begin(), results.end());
        bool isSequence = true;
        for (size_t i = 0; i < results.size(); ++i)
        {
            isSequence = isSequence && results[i] == i;
        }
        WALLET_CHECK(isSequence);
    }

    void TestInMemoryTracker()
    {
        cout << "Testing in-memory nonce tracker...\n";

        InMemoryNonceTracker tracker;
        WALLET_CHECK(!tracker.peek(kNetwork, kAddress));
        WALLET_CHECK(tracker.reserve(kNetwork, kAddress) == 0);
        WALLET_CHECK(tracker.reserve(kNetwork, kAddress) == 1);
        WALLET_CHECK(tracker.reserve("polygon", kAddress) == 0);
        WALLET_CHECK(*tracker.peek(kNetwork, kAddress) == 2);

        tracker.markUsed(kNetwork, kAddress, 7);
        WALLET_CHECK(*tracker.peek(kNetwork, kAddress) == 8);
        tracker.markUsed(kNetwork, kAddress, 3);
        WALLET_CHECK(*tracker.peek(kNetwork, kAddress) == 8);

        tracker.remove(kNetwork, kAddress);
        WALLET_CHECK(!tracker.peek(kNetwork, kAddress));

        CheckConcurrentReservations([&tracker]() { return tracker.reserve(kNetwork, kAddress); }, 8, 250);
    }

    void TestInMemoryOverflow()
    {
        cout << "Testing in-memory nonce overflow...\n";

        InMemoryNonceTracker tracker;
        const auto max = numeric_limits<uint64_t>::max();
        tracker.markUsed(kNetwork, kAddress, max - 2);
        WALLET_CHECK(tracker.reserve(kNetwork, kAddress) == max - 1);
        WALLET_CHECK_ERROR(tracker.reserve(kNetwork, kAddress), ErrorCode::NonceOverflow);
        WALLET_CHECK_ERROR(tracker.reserve(kNetwork, kAddress), ErrorCode::NonceOverflow);
        WALLET_CHECK_ERROR(tracker.markUsed(kNetwork, kAddress, max), ErrorCode::NonceOverflow);
    }

    void TestLedger(IWalletStorage::Ptr storage)
    {
        NonceLedger ledger(storage);

        WALLET_CHECK(ledger.reserve(kNetwork, kAddress) == 0);
        WALLET_CHECK(ledger.reserve(kNetwork, kAddress) == 1);

        // tiers are independent
        WALLET_CHECK(ledger.reserveLocal(kNetwork, kAddress) == 0);

        ledger.markUsed(kNetwork, kAddress, 5);
        WALLET_CHECK(*ledger.getNext(kNetwork, kAddress) == 6);
        WALLET_CHECK(*ledger.getTracker().peek(kNetwork, kAddress) == 6);
        WALLET_CHECK(ledger.reserve(kNetwork, kAddress) == 6);

        ledger.purge(kNetwork, kAddress);
        WALLET_CHECK(!ledger.getNext(kNetwork, kAddress));
        WALLET_CHECK(!ledger.getTracker().peek(kNetwork, kAddress));

        CheckConcurrentReservations([&ledger]() { return ledger.reserve(kNetwork, kAddress); }, 8, 50);
        ledger.purge(kNetwork, kAddress);
    }

    // limit is the largest value the storage keeps as the next sequence
    void TestLedgerCapacity(IWalletStorage::Ptr storage, uint64_t limit)
    {
        NonceLedger ledger(storage);
        ledger.markUsed(kNetwork, kAddress, limit - 2);
        WALLET_CHECK(ledger.reserve(kNetwork, kAddress) == limit - 1);
        WALLET_CHECK_ERROR(ledger.reserve(kNetwork, kAddress), ErrorCode::CapacityFull);
        WALLET_CHECK(*ledger.getNext(kNetwork, kAddress) == limit);
        WALLET_CHECK_ERROR(ledger.markUsed(kNetwork, kAddress, limit), ErrorCode::CapacityFull);
        ledger.purge(kNetwork, kAddress);
    }

    void TestMemoryLedger()
    {
        cout << "Testing nonce ledger over memory storage...\n";
        TestLedger(make_shared<MemoryWalletStorage>());
        TestLedgerCapacity(make_shared<MemoryWalletStorage>(), numeric_limits<uint64_t>::max());
    }

    void TestSqliteLedger()
    {
        cout << "Testing nonce ledger over sqlite storage...\n";

        auto path = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("warden-nonce-%%%%-%%%%.db")).string();
        TestLedger(SqliteWalletStorage::open(path));
        TestLedgerCapacity(SqliteWalletStorage::open(path), static_cast<uint64_t>(numeric_limits<int64_t>::max()));

        {
            // two connections to one file behave like two processes
            auto first = SqliteWalletStorage::open(path);
            auto second = SqliteWalletStorage::open(path);
            NonceLedger a(first);
            NonceLedger b(second);
            set<uint64_t> values;
            for (int i = 0; i < 20; ++i)
            {
                values.insert(a.reserve("bitcoin", "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH"));
                values.insert(b.reserve("bitcoin", "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH"));
            }
            WALLET_CHECK(values.size() == 40);
            WALLET_CHECK(*values.begin() == 0 && *values.rbegin() == 39);
        }
        boost::filesystem::remove(path);
    }
}

int main()
{
    auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

    TestInMemoryTracker();
    TestInMemoryOverflow();
    TestMemoryLedger();
    TestSqliteLedger();

    return WALLET_CHECK_RESULT;
}
