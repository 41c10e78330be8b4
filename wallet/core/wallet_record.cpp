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

#include "wallet_record.h"
#include "common.h"
#include "utility/hex.h"

#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace warden::wallet
{
    namespace
    {
        const char kCiphertext[] = "ciphertext";
        const char kSalt[] = "salt";
        const char kNonce[] = "nonce";
        const char kSchemaVersion[] = "schemaVersion";
        const char kKekId[] = "kekId";
        const char kQuantumSafe[] = "quantumSafe";
        const char kVerifier[] = "verifier";
        const char kIterations[] = "iterations";
        const char kHash[] = "hash";
        const char kAddresses[] = "addresses";
        const char kMultisigThreshold[] = "multisigThreshold";
        const char kNetworks[] = "networks";

        ByteBuffer ReadHex(const json& obj, const char* key)
        {
            return from_hex_strict(obj.at(key).get<std::string>());
        }
    }

    bool WalletRecord::supportsNetwork(const std::string& tag) const
    {
        return std::find(m_networks.begin(), m_networks.end(), tag) != m_networks.end();
    }

    std::string WalletRecord::serializeEncryptedData() const
    {
        json obj =
        {
            { kCiphertext, to_hex(m_envelope.m_ciphertext) },
            { kSalt, to_hex(m_envelope.m_salt) },
            { kNonce, to_hex(m_envelope.m_nonce) },
            { kSchemaVersion, m_envelope.m_schemaVersion },
            { kKekId, m_envelope.m_kekId },
            { kQuantumSafe, m_envelope.m_quantumSafe },
            { kVerifier,
                {
                    { kSalt, to_hex(m_verifier.m_salt) },
                    { kIterations, m_verifier.m_iterations },
                    { kHash, to_hex(m_verifier.m_hash) }
                }
            },
            { kAddresses, m_addresses },
            { kMultisigThreshold, m_multisigThreshold },
            { kNetworks, m_networks }
        };
        return obj.dump();
    }

    void WalletRecord::deserializeEncryptedData(const std::string& data)
    {
        try
        {
            auto obj = json::parse(data);

            crypto::Envelope envelope;
            envelope.m_ciphertext = ReadHex(obj, kCiphertext);
            envelope.m_salt = ReadHex(obj, kSalt);
            envelope.m_nonce = ReadHex(obj, kNonce);
            envelope.m_schemaVersion = obj.value(kSchemaVersion, crypto::kSchemaV1);
            envelope.m_kekId = obj.value(kKekId, std::string());
            envelope.m_quantumSafe = obj.value(kQuantumSafe, false);

            crypto::PasswordVerifier verifier;
            if (obj.contains(kVerifier))
            {
                const auto& v = obj[kVerifier];
                verifier.m_salt = ReadHex(v, kSalt);
                verifier.m_iterations = v.at(kIterations).get<uint32_t>();
                verifier.m_hash = ReadHex(v, kHash);
            }

            std::map<std::string, std::string> addresses;
            if (obj.contains(kAddresses))
            {
                addresses = obj[kAddresses].get<std::map<std::string, std::string>>();
            }

            std::vector<std::string> networks;
            if (obj.contains(kNetworks))
            {
                networks = obj[kNetworks].get<std::vector<std::string>>();
            }

            m_envelope = std::move(envelope);
            m_verifier = std::move(verifier);
            m_addresses = std::move(addresses);
            m_networks = std::move(networks);
            m_multisigThreshold = obj.value(kMultisigThreshold, 1u);
            m_quantumSafe = m_envelope.m_quantumSafe;
        }
        catch (const std::exception&)
        {
            throw WalletException(ErrorCode::StorageError, "malformed wallet record: " + m_name);
        }
    }

    WalletSummary MakeSummary(const WalletRecord& record)
    {
        WalletSummary summary;
        summary.m_id = record.m_id;
        summary.m_name = record.m_name;
        summary.m_createdAt = record.m_createdAt;
        summary.m_quantumSafe = record.m_quantumSafe;
        summary.m_multisigThreshold = record.m_multisigThreshold;
        summary.m_networks = record.m_networks;
        summary.m_schemaVersion = record.m_envelope.m_schemaVersion;
        summary.m_kekId = record.m_envelope.m_kekId;
        return summary;
    }
} // namespace warden::wallet
