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

#include "multisig.h"

#include "utility/helpers.h"
#include "utility/hex.h"
#include "utility/logger.h"

#include <set>

namespace warden::wallet
{
    namespace
    {
        std::string DefaultBroadcast(const MultisigProposal& proposal)
        {
            return "multisig_" + proposal.m_id;
        }

        void ValidateSignatures(const std::vector<std::string>& signatures)
        {
            std::set<std::string> unique;
            for (const auto& signature : signatures)
            {
                bool isValid = false;
                auto bytes = from_hex(signature, &isValid);
                if (!isValid || bytes.empty())
                {
                    throw WalletException(ErrorCode::ValidationError, "malformed signature");
                }
                if (!unique.insert(to_hex(bytes.data(), bytes.size())).second)
                {
                    throw WalletException(ErrorCode::ValidationError, "duplicate signature");
                }
            }
        }
    }

    MultisigCoordinator::MultisigCoordinator(uint32_t maxSigners, MultisigBroadcaster broadcaster)
        : m_maxSigners(maxSigners)
        , m_broadcaster(broadcaster ? std::move(broadcaster) : MultisigBroadcaster(DefaultBroadcast))
    {
    }

    std::string MultisigCoordinator::assemble(const NetworkInfo& network,
                                              const std::string& to,
                                              const std::string& amount,
                                              const std::vector<std::string>& signatures,
                                              uint32_t threshold) const
    {
        ValidateAddress(network, to);
        auto value = ParseAmount(amount, GetNetworkDecimals(network));

        if (threshold == 0)
        {
            throw WalletException(ErrorCode::ValidationError, "threshold must be at least 1");
        }
        if (threshold > m_maxSigners)
        {
            throw WalletException(ErrorCode::ValidationError, "threshold exceeds the signer set size " + std::to_string(m_maxSigners));
        }
        if (signatures.size() > m_maxSigners)
        {
            throw WalletException(ErrorCode::ValidationError, "more signatures than signers");
        }
        if (signatures.size() < threshold)
        {
            throw WalletException(ErrorCode::ValidationError,
                "insufficient signatures: " + std::to_string(signatures.size()) + " of " + std::to_string(threshold));
        }
        ValidateSignatures(signatures);

        MultisigProposal proposal;
        proposal.m_id = generate_uuid();
        proposal.m_network = network;
        proposal.m_to = to;
        proposal.m_amount = value;
        proposal.m_threshold = threshold;
        proposal.m_signatures = signatures;

        auto txId = m_broadcaster(proposal);
        LOG_INFO() << "Multisig transaction " << txId << " assembled with " << signatures.size() << "/" << threshold << " signatures";
        return txId;
    }
} // namespace warden::wallet
