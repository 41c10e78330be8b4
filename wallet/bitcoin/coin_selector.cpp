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

#include "coin_selector.h"
#include "common.h"

#include "utility/logger.h"
#include "wallet/core/common.h"

#include <algorithm>
#include <limits>

namespace warden::bitcoin
{
    namespace
    {
        const size_t kSelectionOutputCount = 2;

        bool AddOverflows(Amount a, Amount b)
        {
            return a > std::numeric_limits<Amount>::max() - b;
        }
    }

    uint64_t EstimateTxSize(size_t inputCount, size_t outputCount)
    {
        return 10 + 148 * static_cast<uint64_t>(inputCount) + 34 * static_cast<uint64_t>(outputCount);
    }

    CoinSelection SelectCoins(std::vector<Utxo> utxos, Amount target, Amount feeRate)
    {
        using wallet::ErrorCode;
        using wallet::WalletException;

        if (target == 0)
        {
            throw WalletException(ErrorCode::ValidationError, "amount must be positive");
        }
        if (utxos.empty())
        {
            throw WalletException(ErrorCode::InsufficientFunds, "no spendable outputs");
        }

        std::stable_sort(utxos.begin(), utxos.end(), [](const Utxo& a, const Utxo& b)
        {
            return a.m_value > b.m_value;
        });

        CoinSelection res;
        for (const auto& utxo : utxos)
        {
            if (AddOverflows(res.m_total, utxo.m_value))
            {
                throw WalletException(ErrorCode::ValidationError, "output values overflow");
            }
            res.m_selected.push_back(utxo);
            res.m_total += utxo.m_value;

            auto size = EstimateTxSize(res.m_selected.size(), kSelectionOutputCount);
            if (feeRate != 0 && size > std::numeric_limits<Amount>::max() / feeRate)
            {
                throw WalletException(ErrorCode::ValidationError, "fee rate is too high");
            }
            Amount fee = size * feeRate;
            if (AddOverflows(target, fee))
            {
                throw WalletException(ErrorCode::ValidationError, "amount is too large");
            }

            if (res.m_total >= target + fee)
            {
                res.m_fee = fee;
                res.m_change = res.m_total - target - fee;
                if (res.m_change < kDustThreshold)
                {
                    res.m_fee += res.m_change;
                    res.m_change = 0;
                }

                LOG_DEBUG() << "Selected " << res.m_selected.size() << " outputs, total " << res.m_total
                            << ", fee " << res.m_fee << ", change " << res.m_change;
                return res;
            }
        }

        throw WalletException(ErrorCode::InsufficientFunds,
            "insufficient balance: have " + std::to_string(res.m_total) + " satoshi, need " + std::to_string(target) + " plus fee");
    }
} // namespace warden::bitcoin
