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

#include "settings.h"

#include "utility/config.h"
#include "utility/logger.h"

#include <boost/algorithm/string.hpp>
#include <limits>

namespace warden::wallet
{
    namespace
    {
        const char kRpcPrefix[] = "ethereum.rpc.";
        const uint32_t kMinIterations = 1000;
    }

    ServiceSettings ServiceSettings::fromConfig(const Config& config)
    {
        ServiceSettings settings;

        settings.m_kekEnv = config.get_string("kek.env", settings.m_kekEnv);
        settings.m_kekId = config.get_string("kek.id", settings.m_kekId);
        settings.m_testMode = config.get_bool("test_mode", settings.m_testMode);

        auto iterations = config.get_u64("password.pbkdf2_iterations", settings.m_pbkdf2Iterations);
        if (iterations < kMinIterations || iterations > std::numeric_limits<uint32_t>::max())
        {
            throw WalletException(ErrorCode::ValidationError, "password.pbkdf2_iterations is out of range");
        }
        settings.m_pbkdf2Iterations = static_cast<uint32_t>(iterations);
        settings.m_passwordPolicy.m_minLength = config.get_int("password.min_length", static_cast<int>(settings.m_passwordPolicy.m_minLength), 1, 1024);
        settings.m_passwordPolicy.m_requireSpecial = config.get_bool("password.require_special", settings.m_passwordPolicy.m_requireSpecial);

        for (const auto& tag : config.get_keys_with_prefix(kRpcPrefix))
        {
            auto network = FindNetwork(tag);
            if (!network || network->m_type != NetworkType::Ethereum)
            {
                LOG_WARNING() << "Ignoring RPC endpoint of unknown network " << tag;
                continue;
            }
            settings.m_rpcOverrides[network->m_tag] = config.get_string(kRpcPrefix + tag);
        }

        settings.m_indexerUrl = config.get_string("bitcoin.indexer_url", settings.m_indexerUrl);
        settings.m_feeRate = config.get_u64("bitcoin.fee_rate", settings.m_feeRate);
        if (settings.m_feeRate == 0)
        {
            throw WalletException(ErrorCode::ValidationError, "bitcoin.fee_rate must be positive");
        }

        auto feeSource = boost::algorithm::to_lower_copy(config.get_string("bitcoin.fee_source", "fixed"));
        if (feeSource == "fixed")
        {
            settings.m_feeSource = FeeSource::Fixed;
        }
        else if (feeSource == "indexer")
        {
            settings.m_feeSource = FeeSource::Indexer;
        }
        else
        {
            throw WalletException(ErrorCode::ValidationError, "bitcoin.fee_source must be fixed or indexer");
        }

        settings.m_timeoutMsec = config.get_int("network.timeout_ms", static_cast<int>(settings.m_timeoutMsec), 100, 600000);
        settings.m_maxSigners = config.get_int("multisig.max_signers", static_cast<int>(settings.m_maxSigners), 1, 1000);

        return settings;
    }

    std::string ServiceSettings::getRpcUrl(const NetworkInfo& network) const
    {
        if (network.m_type == NetworkType::Bitcoin)
        {
            return m_indexerUrl;
        }

        auto it = m_rpcOverrides.find(network.m_tag);
        return it != m_rpcOverrides.end() ? it->second : network.m_defaultRpc;
    }
} // namespace warden::wallet
