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
#include "utility/hex.h"
#include "utility/logger.h"
#include "wallet/core/multisig.h"

WALLET_TEST_INIT

using namespace warden::wallet;
using namespace std;

namespace
{
    const char kEthRecipient[] = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    const char kBtcRecipient[] = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH";

    vector<string> MakeSignatures(size_t count)
    {
        vector<string> res;
        for (size_t i = 0; i < count; ++i)
        {
            uint8_t tag = static_cast<uint8_t>(i);
            res.push_back("30440220" + string(60, 'a') + warden::to_hex(&tag, 1));
        }
        return res;
    }

    void TestThresholds()
    {
        cout << "Testing multisig thresholds...\n";

        MultisigCoordinator coordinator;
        auto ethereum = GetNetwork("ethereum");
        WALLET_CHECK(coordinator.getMaxSigners() == kDefaultMaxSigners);

        auto two = MakeSignatures(2);
        auto three = MakeSignatures(3);
        auto fifteen = MakeSignatures(15);
        auto sixteen = MakeSignatures(16);

        WALLET_CHECK(coordinator.assemble(ethereum, kEthRecipient, "1", two, 2).find("multisig_") == 0);
        WALLET_CHECK(coordinator.assemble(ethereum, kEthRecipient, "1", three, 2).find("multisig_") == 0);
        WALLET_CHECK_NO_THROW(coordinator.assemble(ethereum, kEthRecipient, "1", fifteen, 15));

        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", two, 3), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", two, 0), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", sixteen, 16), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", sixteen, 2), ErrorCode::ValidationError);

        // every call gets its own transaction id
        WALLET_CHECK(coordinator.assemble(ethereum, kEthRecipient, "1", two, 1) != coordinator.assemble(ethereum, kEthRecipient, "1", two, 1));
    }

    void TestValidation()
    {
        cout << "Testing multisig validation...\n";

        MultisigCoordinator coordinator(3);
        auto ethereum = GetNetwork("ethereum");
        auto bitcoin = GetNetwork("bitcoin");
        auto two = MakeSignatures(2);

        // recipient and amount are checked before the signature count
        vector<string> none;
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, "0xdead", "1", none, 2), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "0", two, 2), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(bitcoin, kEthRecipient, "1", two, 2), ErrorCode::ValidationError);
        WALLET_CHECK_ERROR(coordinator.assemble(bitcoin, kBtcRecipient, "0.000000001", two, 2), ErrorCode::ValidationError);
        WALLET_CHECK_NO_THROW(coordinator.assemble(bitcoin, kBtcRecipient, "0.5", two, 2));

        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", MakeSignatures(4), 2), ErrorCode::ValidationError);

        vector<string> duplicated = { two[0], two[0] };
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", duplicated, 2), ErrorCode::ValidationError);

        vector<string> malformed = { two[0], "not hex" };
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", malformed, 2), ErrorCode::ValidationError);

        vector<string> empty = { two[0], "" };
        WALLET_CHECK_ERROR(coordinator.assemble(ethereum, kEthRecipient, "1", empty, 2), ErrorCode::ValidationError);
    }

    void TestBroadcaster()
    {
        cout << "Testing multisig broadcaster...\n";

        MultisigProposal seen;
        int calls = 0;
        MultisigCoordinator coordinator(5, [&](const MultisigProposal& proposal)
        {
            seen = proposal;
            ++calls;
            return string("0xfeed");
        });

        auto three = MakeSignatures(3);
        auto txId = coordinator.assemble(GetNetwork("polygon"), kEthRecipient, "2.5", three, 2);
        WALLET_CHECK(txId == "0xfeed");
        WALLET_CHECK(calls == 1);
        WALLET_CHECK(seen.m_network.m_chainId == 137);
        WALLET_CHECK(seen.m_to == kEthRecipient);
        WALLET_CHECK(seen.m_amount == BaseUnits("2500000000000000000"));
        WALLET_CHECK(seen.m_threshold == 2);
        WALLET_CHECK(seen.m_signatures == three);
        WALLET_CHECK(!seen.m_id.empty());

        // rejected proposals never reach the chain
        WALLET_CHECK_THROW(coordinator.assemble(GetNetwork("polygon"), kEthRecipient, "2.5", three, 4));
        WALLET_CHECK(calls == 1);

        MultisigCoordinator failing(5, [](const MultisigProposal&) -> string
        {
            throw WalletException(ErrorCode::NetworkError, "broadcast failed");
        });
        WALLET_CHECK_ERROR(failing.assemble(GetNetwork("ethereum"), kEthRecipient, "1", three, 2), ErrorCode::NetworkError);
    }
}

int main()
{
    auto logger = warden::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

    TestThresholds();
    TestValidation();
    TestBroadcaster();

    return WALLET_CHECK_RESULT;
}
