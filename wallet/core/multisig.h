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
#include "validation.h"

#include <functional>
#include <string>
#include <vector>

namespace warden::wallet
{
    constexpr uint32_t kDefaultMaxSigners = 15;

    struct MultisigProposal
    {
        std::string m_id;
        NetworkInfo m_network;
        std::string m_to;
        BaseUnits m_amount = 0;
        uint32_t m_threshold = 0;
        std::vector<std::string> m_signatures; // opaque, hex
    };

    // Hands a validated proposal to the chain, returns the transaction id.
    // May throw WalletException.
    using MultisigBroadcaster = std::function<std::string(const MultisigProposal&)>;

    /// M-of-N gate in front of a broadcaster. Recipient and amount are checked
    /// regardless of how many signatures were supplied.
    class MultisigCoordinator
    {
    public:
        // the default broadcaster returns "multisig_<uuid>"
        explicit MultisigCoordinator(uint32_t maxSigners = kDefaultMaxSigners, MultisigBroadcaster broadcaster = {});

        // throws ValidationError for a bad recipient, amount, threshold or signature set
        std::string assemble(const NetworkInfo& network,
                             const std::string& to,
                             const std::string& amount,
                             const std::vector<std::string>& signatures,
                             uint32_t threshold) const;

        uint32_t getMaxSigners() const { return m_maxSigners; }

    private:
        uint32_t m_maxSigners;
        MultisigBroadcaster m_broadcaster;
    };
} // namespace warden::wallet
