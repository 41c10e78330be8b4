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

#include "core/envelope.h"
#include "core/password.h"
#include "utility/common.h"

#include <map>
#include <string>
#include <vector>

namespace warden::wallet
{
    /// Identity and encrypted secret container of one wallet.
    /// Carries no plaintext key material and is safe to copy.
    struct WalletRecord
    {
        std::string m_id;
        std::string m_name;
        Timestamp m_createdAt = 0;
        Timestamp m_updatedAt = 0;
        bool m_quantumSafe = false;
        uint32_t m_multisigThreshold = 1;
        std::vector<std::string> m_networks;

        crypto::Envelope m_envelope;
        crypto::PasswordVerifier m_verifier;

        // network tag -> public address, derived once when the key is created
        std::map<std::string, std::string> m_addresses;

        crypto::WalletIdentity getIdentity() const { return { m_id, m_name }; }
        bool supportsNetwork(const std::string& tag) const;

        // JSON body of the `encryptedData` column
        std::string serializeEncryptedData() const;
        void deserializeEncryptedData(const std::string& data);
    };

    /// Non-secret view returned by listWallets
    struct WalletSummary
    {
        std::string m_id;
        std::string m_name;
        Timestamp m_createdAt = 0;
        bool m_quantumSafe = false;
        uint32_t m_multisigThreshold = 1;
        std::vector<std::string> m_networks;
        uint32_t m_schemaVersion = 0;
        std::string m_kekId;
    };

    WalletSummary MakeSummary(const WalletRecord& record);
} // namespace warden::wallet
