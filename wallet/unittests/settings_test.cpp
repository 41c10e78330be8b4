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
#include "utility/config.h"
#include "utility/logger.h"
#include "wallet/core/multisig.h"
#include "wallet/core/settings.h"

WALLET_TEST_INIT

using namespace warden::wallet;
using namespace std;

using warden::Config;

namespace
{
    Config Load(const string& text)
    {
        Config config;
        config.load_from_string(text);
        return config;
    }

    void TestDefaults()
    {
        cout << "Testing default settings...\n";

        auto settings = ServiceSettings::fromConfig(Config());
        WALLET_CHECK(settings.m_kekEnv == "WALLET_ENC_KEY");
        WALLET_CHECK(settings.m_kekId == "kek-1");
        WALLET_CHECK(!settings.m_testMode);
        WALLET_CHECK(settings.m_pbkdf2Iterations == warden::crypto::PasswordVerifier::kDefaultIterations);
        WALLET_CHECK(settings.m_feeRate == 10);
        WALLET_CHECK(settings.m_feeSource == FeeSource::Fixed);
        WALLET_CHECK(settings.m_timeoutMsec == 30000);
        WALLET_CHECK(settings.m_maxSigners == kDefaultMaxSigners);
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("ethereum")) == GetNetwork("ethereum").m_defaultRpc);
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("bitcoin")) == kDefaultBitcoinIndexer);
    }

    void TestOverrides()
    {
        cout << "Testing configured settings...\n";

        auto config = Load(R"({
            "kek": { "env": "MY_KEK", "id": "kek-9" },
            "test_mode": true,
            "password": { "pbkdf2_iterations": 5000, "min_length": 12, "require_special": true },
            "ethereum": { "rpc": { "polygon": "http://localhost:8545", "eth": "http://localhost:8546", "dogecoin": "http://x" } },
            "bitcoin": { "indexer_url": "http://localhost:3002", "fee_rate": 25, "fee_source": "Indexer" },
            "network": { "timeout_ms": 5000 },
            "multisig": { "max_signers": 7 }
        })");

        auto settings = ServiceSettings::fromConfig(config);
        WALLET_CHECK(settings.m_kekEnv == "MY_KEK");
        WALLET_CHECK(settings.m_kekId == "kek-9");
        WALLET_CHECK(settings.m_testMode);
        WALLET_CHECK(settings.m_pbkdf2Iterations == 5000);
        WALLET_CHECK(settings.m_passwordPolicy.m_minLength == 12);
        WALLET_CHECK(settings.m_passwordPolicy.m_requireSpecial);
        WALLET_CHECK(settings.m_rpcOverrides.size() == 2);
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("polygon")) == "http://localhost:8545");
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("ethereum")) == "http://localhost:8546");
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("bsc")) == GetNetwork("bsc").m_defaultRpc);
        WALLET_CHECK(settings.getRpcUrl(GetNetwork("bitcoin")) == "http://localhost:3002");
        WALLET_CHECK(settings.m_feeRate == 25);
        WALLET_CHECK(settings.m_feeSource == FeeSource::Indexer);
        WALLET_CHECK(settings.m_timeoutMsec == 5000);
        WALLET_CHECK(settings.m_maxSigners == 7);

        // the policy is live
        WALLET_CHECK(settings.m_passwordPolicy.validate("Str0ngPass12"));
        WALLET_CHECK(!settings.m_passwordPolicy.validate("Str0ng!Pass12"));
    }

    void TestBadValues()
    {
        cout << "Testing invalid settings...\n";

        auto lowIterations = Load(R"({ "password": { "pbkdf2_iterations": 10 } })");
        WALLET_CHECK_ERROR(ServiceSettings::fromConfig(lowIterations), ErrorCode::ValidationError);

        auto zeroFee = Load(R"({ "bitcoin": { "fee_rate": 0 } })");
        WALLET_CHECK_ERROR(ServiceSettings::fromConfig(zeroFee), ErrorCode::ValidationError);

        auto badSource = Load(R"({ "bitcoin": { "fee_source": "oracle" } })");
        WALLET_CHECK_ERROR(ServiceSettings::fromConfig(badSource), ErrorCode::ValidationError);

        // clamped into range
        auto clamped = Load(R"({ "network": { "timeout_ms": 1 }, "multisig": { "max_signers": 100000 } })");
        auto settings = ServiceSettings::fromConfig(clamped);
        WALLET_CHECK(settings.m_timeoutMsec == 100);
        WALLET_CHECK(settings.m_maxSigners == 1000);
    }
}

int main()
{
    auto logger = warden::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

    TestDefaults();
    TestOverrides();
    TestBadValues();

    return WALLET_CHECK_RESULT;
}
