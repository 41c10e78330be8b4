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
#include "test_bridges.h"
#include "utility/logger.h"
#include "wallet/core/wallet_service.h"
#include "wallet/ethereum/common.h"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

WALLET_TEST_INIT

using namespace warden::wallet;
using namespace std;

using warden::crypto::KekRing;
using warden::crypto::RootKek;
using warden::testing::FakeBitcoinBridge;
using warden::testing::FakeEthereumBridge;

namespace
{
    const char kPassword[] = "Str0ng!Pass";
    const char kEthRecipient[] = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    const char kBtcRecipient[] = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH";
    const char kTestMnemonic[] = "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

    KekRing MakeKeks()
    {
        KekRing keks;
        keks.add(RootKek::fromEncoded(string(64, '0'), "kek-1", true));
        return keks;
    }

    ServiceSettings MakeSettings()
    {
        ServiceSettings settings;
        settings.m_testMode = true;
        settings.m_pbkdf2Iterations = 1000;
        return settings;
    }

    /// Service over in-memory storage with the fake bridges plugged in
    struct TestContext
    {
        explicit TestContext(IWalletStorage::Ptr storage = make_shared<MemoryWalletStorage>())
            : m_keks(MakeKeks())
            , m_ethBridge(make_shared<FakeEthereumBridge>())
            , m_btcBridge(make_shared<FakeBitcoinBridge>())
            , m_service(m_ioc, storage, m_keks, MakeSettings())
        {
            auto ethBridge = m_ethBridge;
            m_service.setEthereumBridgeFactory([ethBridge](const NetworkInfo&, const string&) { return ethBridge; });
            auto btcBridge = m_btcBridge;
            m_service.setBitcoinBridgeFactory([btcBridge](const string&) { return btcBridge; });
        }

        struct SendOutcome
        {
            bool m_called = false;
            Error m_error;
            SendResult m_result;
        };

        SendOutcome send(const string& name, const string& to, const string& amount, const string& network, const string& password = kPassword)
        {
            SendOutcome outcome;
            m_service.sendTransaction(name, to, amount, network, password, [&outcome](const Error& error, const SendResult& result)
            {
                outcome.m_called = true;
                outcome.m_error = error;
                outcome.m_result = result;
            });
            return outcome;
        }

        pair<Error, Balance> balance(const string& name, const string& network, const string& password = kPassword)
        {
            pair<Error, Balance> res;
            m_service.getBalance(name, network, password, [&res](const Error& error, const Balance& balance)
            {
                res = make_pair(error, balance);
            });
            return res;
        }

        boost::asio::io_context m_ioc;
        KekRing m_keks;
        shared_ptr<FakeEthereumBridge> m_ethBridge;
        shared_ptr<FakeBitcoinBridge> m_btcBridge;
        WalletService m_service;
    };

    void TestCreateAndList()
    {
        cout << "Testing wallet creation...\n";

        TestContext ctx;
        auto& service = ctx.m_service;

        auto words = service.createWallet("w1", kPassword, false);
        WALLET_CHECK(words.size() == 24);
        WALLET_CHECK(warden::isValidMnemonic(words));

        WALLET_CHECK_ERROR(service.createWallet("w1", kPassword, false), ErrorCode::AlreadyExists);
        WALLET_CHECK_ERROR(service.createWallet("", kPassword, false), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.createWallet("bad name", kPassword, false), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.createWallet("../etc", kPassword, false), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.createWallet(string(65, 'a'), kPassword, false), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.createWallet("w2", "short", false), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.createWallet("w2", "alllowercase1", false), ErrorCode::ValidationError);
        WALLET_CHECK_NO_THROW(service.createWallet("w2", kPassword, true));

        auto wallets = service.listWallets();
        WALLET_CHECK(wallets.size() == 2);
        WALLET_CHECK(wallets[0].m_name == "w1" && !wallets[0].m_quantumSafe);
        WALLET_CHECK(wallets[1].m_name == "w2" && wallets[1].m_quantumSafe);
        WALLET_CHECK(wallets[0].m_networks == GetSupportedNetworks());
        WALLET_CHECK(wallets[0].m_kekId == "kek-1");
        WALLET_CHECK(wallets[0].m_id != wallets[1].m_id);

        // every wallet starts with key version 1
        auto label = service.getKeyRegistry().getCurrent(GetWalletKeyLabel("w1"));
        WALLET_CHECK(label && label->m_currentVersion == 1);
    }

    void TestRestore()
    {
        cout << "Testing wallet restore...\n";

        TestContext ctx;
        auto& service = ctx.m_service;

        const string thirteen = string(kTestMnemonic) + " abandon";
        WALLET_CHECK_ERROR(service.restoreWallet("r1", thirteen, kPassword, false), ErrorCode::ValidationError);

        string badChecksum;
        for (int i = 0; i < 12; ++i)
        {
            badChecksum += "abandon ";
        }
        WALLET_CHECK_ERROR(service.restoreWallet("r1", badChecksum, kPassword, false), ErrorCode::ValidationError);
        WALLET_CHECK(service.listWallets().empty());

        service.restoreWallet("r1", kTestMnemonic, kPassword, false);
        service.restoreWallet("r2", boost::algorithm::to_upper_copy(string(kTestMnemonic)), kPassword, true);
        WALLET_CHECK_ERROR(service.restoreWallet("r1", kTestMnemonic, kPassword, false), ErrorCode::AlreadyExists);

        // same words, same keys, regardless of the envelope
        WALLET_CHECK(service.getAddress("r1", "ethereum", kPassword) == service.getAddress("r2", "ethereum", kPassword));
        WALLET_CHECK(service.getAddress("r1", "bitcoin", kPassword) == service.getAddress("r2", "bitcoin", kPassword));

        auto words = service.createWallet("w1", kPassword, false);
        service.restoreWallet("w1-copy", boost::algorithm::join(words, " "), "An0ther!Pass", false);
        WALLET_CHECK(service.getAddress("w1", "ethereum", kPassword) == service.getAddress("w1-copy", "ethereum", "An0ther!Pass"));
        WALLET_CHECK(service.getAddress("w1", "ethereum", kPassword) != service.getAddress("r1", "ethereum", kPassword));
    }

    void TestAddresses()
    {
        cout << "Testing wallet addresses...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);

        auto first = service.getAddress("w1", "ethereum", kPassword);
        auto second = service.getAddress("w1", "ethereum", kPassword);
        WALLET_CHECK(first == second);
        WALLET_CHECK(first.size() == 42);
        WALLET_CHECK(warden::ethereum::IsValidEthAddress(first));
        WALLET_CHECK(warden::ethereum::ConvertEthAddressToChecksumStr(warden::ethereum::ConvertStrToEthAddress(first)) == first);
        WALLET_CHECK(service.getAddress("w1", "polygon", kPassword) == first);

        auto btc = service.getAddress("w1", "btc", kPassword);
        WALLET_CHECK(!btc.empty() && btc[0] == '1');

        WALLET_CHECK_ERROR(service.getAddress("w1", "ethereum", "Wr0ng!Pass"), ErrorCode::CryptoError);
        WALLET_CHECK_ERROR(service.getAddress("w1", "ethereum", ""), ErrorCode::CryptoError);
        WALLET_CHECK_ERROR(service.getAddress("w1", "dogecoin", kPassword), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.getAddress("missing", "ethereum", kPassword), ErrorCode::NotFound);

        // the wrong password message says nothing specific
        try
        {
            service.getAddress("w1", "ethereum", "Wr0ng!Pass");
        }
        catch (const WalletException& ex)
        {
            WALLET_CHECK(string(ex.what()) == kDecryptionFailed);
        }
    }

    void TestSendEthereum()
    {
        cout << "Testing ethereum send...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);
        const auto from = service.getAddress("w1", "ethereum", kPassword);
        const auto label = GetWalletKeyLabel("w1");

        ctx.m_ethBridge->m_txCount = 9;
        auto outcome = ctx.send("w1", kEthRecipient, "0.5", "ethereum");
        WALLET_CHECK(outcome.m_called);
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(outcome.m_result.m_txHash == ctx.m_ethBridge->m_txHash);
        WALLET_CHECK(outcome.m_result.m_from == from);
        WALLET_CHECK(outcome.m_result.m_sequence == 0);
        WALLET_CHECK(outcome.m_result.m_chainNonce == 9);
        WALLET_CHECK(ctx.m_ethBridge->m_rawTransactions.size() == 1);
        WALLET_CHECK(ctx.m_ethBridge->m_requestedAddresses.back() == from);
        WALLET_CHECK(service.getNonceLedger().getNext("ethereum", from) == uint64_t(1));

        auto version = service.getKeyRegistry().findVersion(label, 1);
        WALLET_CHECK(version && version->m_usageCount == 1);

        outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(outcome.m_result.m_sequence == 1);

        // rejected before a sequence is reserved
        const size_t broadcasts = ctx.m_ethBridge->m_rawTransactions.size();
        WALLET_CHECK(ctx.send("w1", kEthRecipient, "1", "ethereum", "Wr0ng!Pass").m_error.m_type == ErrorCode::CryptoError);
        WALLET_CHECK(ctx.send("w1", "0x1234", "1", "ethereum").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("w1", kEthRecipient, "0", "ethereum").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("w1", kEthRecipient, "-1", "ethereum").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("w1", kEthRecipient, "1", "solana").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("missing", kEthRecipient, "1", "ethereum").m_error.m_type == ErrorCode::NotFound);
        WALLET_CHECK(ctx.m_ethBridge->m_rawTransactions.size() == broadcasts);
        WALLET_CHECK(service.getNonceLedger().getNext("ethereum", from) == uint64_t(2));

        // a failed broadcast leaves its sequence skipped
        ctx.m_ethBridge->m_sendError = { warden::ethereum::IBridge::EthError, "insufficient funds for gas * price + value" };
        outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
        WALLET_CHECK(outcome.m_error.m_type == ErrorCode::InsufficientFunds);
        WALLET_CHECK(outcome.m_result.m_txHash.empty());
        WALLET_CHECK(service.getNonceLedger().getNext("ethereum", from) == uint64_t(3));

        ctx.m_ethBridge->m_sendError = { warden::ethereum::IBridge::None, "" };
        ctx.m_ethBridge->m_error = { warden::ethereum::IBridge::Timeout, "" };
        outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
        WALLET_CHECK(outcome.m_error.m_type == ErrorCode::NetworkError);
        WALLET_CHECK(outcome.m_error.isRetryable());

        ctx.m_ethBridge->m_error = { warden::ethereum::IBridge::None, "" };
        outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(outcome.m_result.m_sequence == 4);

        // polygon keeps its own sequence for the same address
        outcome = ctx.send("w1", kEthRecipient, "1", "polygon");
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(outcome.m_result.m_sequence == 0);
        WALLET_CHECK(outcome.m_result.m_from == from);
    }

    void TestSendBitcoin()
    {
        cout << "Testing bitcoin send...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);
        const auto from = service.getAddress("w1", "bitcoin", kPassword);

        ctx.m_btcBridge->m_utxos =
        {
            { string(64, '1'), 0, 500000 },
            { string(64, '2'), 1, 100000 }
        };

        auto outcome = ctx.send("w1", kBtcRecipient, "0.003", "bitcoin");
        WALLET_CHECK(outcome.m_called);
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(outcome.m_result.m_txHash == ctx.m_btcBridge->m_txid);
        WALLET_CHECK(outcome.m_result.m_from == from);
        WALLET_CHECK(outcome.m_result.m_fee == 2260);
        WALLET_CHECK(outcome.m_result.m_sequence == 0);
        WALLET_CHECK(ctx.m_btcBridge->m_rawTransactions.size() == 1);
        WALLET_CHECK(ctx.m_btcBridge->m_requestedAddresses.back() == from);
        // the fixed rate is configured, the indexer is not asked
        WALLET_CHECK(ctx.m_btcBridge->m_feeTargets.empty());
        WALLET_CHECK(service.getNonceLedger().getNext("bitcoin", from) == uint64_t(1));

        outcome = ctx.send("w1", kBtcRecipient, "0.01", "bitcoin");
        WALLET_CHECK(outcome.m_error.m_type == ErrorCode::InsufficientFunds);
        WALLET_CHECK(ctx.m_btcBridge->m_rawTransactions.size() == 1);

        WALLET_CHECK(ctx.send("w1", kEthRecipient, "0.001", "bitcoin").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("w1", kBtcRecipient, "0.000000001", "bitcoin").m_error.m_type == ErrorCode::ValidationError);
        WALLET_CHECK(ctx.send("w1", kBtcRecipient, "184467440737.09551616", "bitcoin").m_error.m_type == ErrorCode::ValidationError);

        ctx.m_btcBridge->m_error = { warden::bitcoin::IBridge::IOError, "connection refused" };
        outcome = ctx.send("w1", kBtcRecipient, "0.001", "bitcoin");
        WALLET_CHECK(outcome.m_error.m_type == ErrorCode::NetworkError);

        auto version = service.getKeyRegistry().findVersion(GetWalletKeyLabel("w1"), 1);
        WALLET_CHECK(version && version->m_usageCount == 1);
    }

    void TestBalance()
    {
        cout << "Testing balances...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);

        ctx.m_ethBridge->m_balance = warden::ethereum::ConvertStrToUint256("1500000000000000000", false);
        auto eth = ctx.balance("w1", "ethereum");
        WALLET_CHECK(eth.first.isOk());
        WALLET_CHECK(eth.second.m_value == BaseUnits("1500000000000000000"));
        WALLET_CHECK(eth.second.m_formatted == "1.5");
        WALLET_CHECK(ctx.m_ethBridge->m_requestedAddresses.back() == service.getAddress("w1", "ethereum", kPassword));

        ctx.m_btcBridge->m_utxos =
        {
            { string(64, '1'), 0, 500000 },
            { string(64, '2'), 1, 100000 }
        };
        auto btc = ctx.balance("w1", "bitcoin");
        WALLET_CHECK(btc.first.isOk());
        WALLET_CHECK(btc.second.m_value == 600000);
        WALLET_CHECK(btc.second.m_formatted == "0.006");

        WALLET_CHECK(ctx.balance("w1", "ethereum", "Wr0ng!Pass").first.m_type == ErrorCode::CryptoError);
        WALLET_CHECK(ctx.balance("missing", "ethereum").first.m_type == ErrorCode::NotFound);

        ctx.m_ethBridge->m_error = { warden::ethereum::IBridge::InvalidResultFormat, "bad json" };
        WALLET_CHECK(ctx.balance("w1", "ethereum").first.m_type == ErrorCode::NetworkError);
    }

    void TestMultisig()
    {
        cout << "Testing multisig send...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);

        const vector<string> signatures = { "aa01", "aa02", "aa03" };
        WALLET_CHECK(service.sendMultiSig("w1", "ethereum", kEthRecipient, "1", signatures, 2).find("multisig_") == 0);

        string network;
        service.setMultisigBroadcaster([&network](const MultisigProposal& proposal)
        {
            network = proposal.m_network.m_tag;
            return string("0xbeef");
        });
        WALLET_CHECK(service.sendMultiSig("w1", "btc", kBtcRecipient, "0.1", signatures, 3) == "0xbeef");
        WALLET_CHECK(network == "bitcoin");

        WALLET_CHECK_ERROR(service.sendMultiSig("w1", "ethereum", kEthRecipient, "1", signatures, 4), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(service.sendMultiSig("missing", "ethereum", kEthRecipient, "1", signatures, 2), ErrorCode::NotFound);
    }

    void TestRotation()
    {
        cout << "Testing signing key rotation...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);
        service.createWallet("w2", kPassword, false);
        const auto address = service.getAddress("w1", "ethereum", kPassword);

        auto result = service.rotateSigningKey("w1");
        WALLET_CHECK(result.m_oldVersion == 1 && result.m_newVersion == 2);
        result = service.rotateSigningKey("w1");
        WALLET_CHECK(result.m_oldVersion == 2 && result.m_newVersion == 3);

        auto versions = service.getKeyRegistry().getVersions(GetWalletKeyLabel("w1"));
        WALLET_CHECK(versions.size() == 3);
        size_t current = 0;
        for (const auto& version : versions)
        {
            if (!version.m_retired)
            {
                ++current;
            }
        }
        WALLET_CHECK(current == 1);

        // other labels are untouched
        WALLET_CHECK(service.getKeyRegistry().getCurrent(GetWalletKeyLabel("w2"))->m_currentVersion == 1);

        // the master key survives re-encryption
        WALLET_CHECK(service.getAddress("w1", "ethereum", kPassword) == address);

        // a new root key takes over on the next rotation, the old one still opens other wallets
        ctx.m_keks.add(RootKek::fromEncoded(string(64, 'a'), "kek-2", true));
        service.rotateSigningKey("w1");
        for (const auto& summary : service.listWallets())
        {
            WALLET_CHECK(summary.m_kekId == (summary.m_name == "w1" ? "kek-2" : "kek-1"));
        }
        WALLET_CHECK(service.getAddress("w1", "ethereum", kPassword) == address);
        WALLET_CHECK_NO_THROW(service.getAddress("w2", "ethereum", kPassword));

        // usage goes to the current version only
        auto outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
        WALLET_CHECK(outcome.m_error.isOk());
        WALLET_CHECK(service.getKeyRegistry().findVersion(GetWalletKeyLabel("w1"), 4)->m_usageCount == 1);
        WALLET_CHECK(service.getKeyRegistry().findVersion(GetWalletKeyLabel("w1"), 1)->m_usageCount == 0);

        WALLET_CHECK_ERROR(service.rotateSigningKey("missing"), ErrorCode::NotFound);
    }

    void TestDelete()
    {
        cout << "Testing wallet deletion...\n";

        TestContext ctx;
        auto& service = ctx.m_service;
        service.createWallet("w1", kPassword, false);
        service.createWallet("w2", kPassword, false);
        const auto from = service.getAddress("w1", "ethereum", kPassword);
        WALLET_CHECK(ctx.send("w1", kEthRecipient, "1", "ethereum").m_error.isOk());
        WALLET_CHECK(service.getNonceLedger().getNext("ethereum", from));

        service.deleteWallet("w1");
        WALLET_CHECK_ERROR(service.getAddress("w1", "ethereum", kPassword), ErrorCode::NotFound);
        WALLET_CHECK_ERROR(service.deleteWallet("w1"), ErrorCode::NotFound);
        WALLET_CHECK(!service.getNonceLedger().getNext("ethereum", from));
        WALLET_CHECK(!service.getKeyRegistry().getCurrent(GetWalletKeyLabel("w1")));

        auto wallets = service.listWallets();
        WALLET_CHECK(wallets.size() == 1 && wallets[0].m_name == "w2");

        // the name can be reused
        WALLET_CHECK_NO_THROW(service.createWallet("w1", kPassword, false));
        WALLET_CHECK(service.getKeyRegistry().getCurrent(GetWalletKeyLabel("w1"))->m_currentVersion == 1);
    }

    void TestDeleteSharedAddress()
    {
        cout << "Testing deletion of a wallet sharing its addresses...\n";

        for (int persisted = 0; persisted < 2; ++persisted)
        {
            auto path = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("warden-shared-%%%%-%%%%.db")).string();
            IWalletStorage::Ptr storage = persisted
                ? IWalletStorage::Ptr(SqliteWalletStorage::open(path))
                : IWalletStorage::Ptr(make_shared<MemoryWalletStorage>());
            {
                TestContext ctx(storage);
                auto& service = ctx.m_service;
                service.restoreWallet("w1", kTestMnemonic, kPassword, false);
                service.restoreWallet("w1-copy", kTestMnemonic, kPassword, false);
                const auto from = service.getAddress("w1", "ethereum", kPassword);

                auto first = ctx.send("w1", kEthRecipient, "1", "ethereum");
                auto second = ctx.send("w1-copy", kEthRecipient, "1", "ethereum");
                WALLET_CHECK(first.m_error.isOk() && second.m_error.isOk());
                WALLET_CHECK(first.m_result.m_sequence == 0);
                WALLET_CHECK(second.m_result.m_sequence == 1);

                service.deleteWallet("w1-copy");
                WALLET_CHECK(service.getNonceLedger().getNext("ethereum", from) == uint64_t(2));

                auto third = ctx.send("w1", kEthRecipient, "1", "ethereum");
                WALLET_CHECK(third.m_error.isOk());
                WALLET_CHECK(third.m_result.m_sequence > second.m_result.m_sequence);

                // the last holder of the address takes its counters with it
                service.deleteWallet("w1");
                WALLET_CHECK(!service.getNonceLedger().getNext("ethereum", from));
            }
            storage.reset();
            boost::filesystem::remove(path);
        }
    }

    void TestPersistence()
    {
        cout << "Testing wallets across restarts...\n";

        auto path = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("warden-service-%%%%-%%%%.db")).string();
        string address;
        {
            TestContext ctx(SqliteWalletStorage::open(path));
            ctx.m_service.createWallet("w1", kPassword, false);
            address = ctx.m_service.getAddress("w1", "ethereum", kPassword);
            WALLET_CHECK(ctx.send("w1", kEthRecipient, "1", "ethereum").m_error.isOk());
            ctx.m_service.rotateSigningKey("w1");
        }
        {
            TestContext ctx(SqliteWalletStorage::open(path));
            auto wallets = ctx.m_service.listWallets();
            WALLET_CHECK(wallets.size() == 1 && wallets[0].m_name == "w1");
            WALLET_CHECK(ctx.m_service.getAddress("w1", "ethereum", kPassword) == address);
            WALLET_CHECK_ERROR(ctx.m_service.getAddress("w1", "ethereum", "Wr0ng!Pass"), ErrorCode::CryptoError);
            WALLET_CHECK(ctx.m_service.getKeyRegistry().getCurrent(GetWalletKeyLabel("w1"))->m_currentVersion == 2);

            // the persisted ledger continues after the restart
            auto outcome = ctx.send("w1", kEthRecipient, "1", "ethereum");
            WALLET_CHECK(outcome.m_error.isOk());
            WALLET_CHECK(outcome.m_result.m_sequence == 1);
        }
        boost::filesystem::remove(path);
    }

    void TestNoRootKey()
    {
        cout << "Testing service without root key...\n";

        boost::asio::io_context ioc;
        KekRing empty;
        WALLET_CHECK_ERROR(WalletService service(ioc, make_shared<MemoryWalletStorage>(), empty, MakeSettings()), ErrorCode::ValidationError);

        WALLET_CHECK_THROW(RootKek::fromEncoded(string(64, '0'), "kek-1", false));
        WALLET_CHECK_THROW(RootKek::fromEncoded("abcd", "kek-1", true));
    }
}

int main()
{
    auto logger = warden::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

    TestCreateAndList();
    TestRestore();
    TestAddresses();
    TestSendEthereum();
    TestSendBitcoin();
    TestBalance();
    TestMultisig();
    TestRotation();
    TestDelete();
    TestDeleteSharedAddress();
    TestPersistence();
    TestNoRootKey();

    return WALLET_CHECK_RESULT;
}
