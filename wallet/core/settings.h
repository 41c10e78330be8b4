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

#include "common.h"
#include "core/password.h"

#include <map>
#include <string>

namespace warden
{
    class Config;
}

namespace warden::wallet
{
    enum class FeeSource
    {
        Fixed,
        Indexer
    };

    /// Everything the wallet service reads from configuration
    struct ServiceSettings
    {
        std::string m_kekEnv = "WALLET_ENC_KEY";
        std::string m_kekId = "kek-1";
        bool m_testMode = false;

        uint32_t m_pbkdf2Iterations = crypto::PasswordVerifier::kDefaultIterations;
        crypto::PasswordPolicy m_passwordPolicy;

        std::map<std::string, std::string> m_rpcOverrides; // network tag -> url
        std::string m_indexerUrl = kDefaultBitcoinIndexer;
        Amount m_feeRate = 10;
        FeeSource m_feeSource = FeeSource::Fixed;
        uint32_t m_feeTarget = 6;

        unsigned m_timeoutMsec = 30000;
        uint32_t m_maxSigners = 15;

        // throws ValidationError for out of range values
        static ServiceSettings fromConfig(const Config& config);

        // configured override or the built-in endpoint of the network
        std::string getRpcUrl(const NetworkInfo& network) const;
    };
} // namespace warden::wallet
