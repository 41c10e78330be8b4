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

#include "utility/common.h"

#include <string>
#include <vector>

namespace warden::bitcoin
{
    struct Utxo
    {
        std::string m_txid;
        uint32_t m_vout = 0;
        Amount m_value = 0;
    };

    struct CoinSelection
    {
        std::vector<Utxo> m_selected;
        Amount m_total = 0;
        Amount m_fee = 0;
        Amount m_change = 0; // zero when below dust, the remainder goes to the fee
    };

    // legacy P2PKH estimate: 10 + 148 per input + 34 per output
    uint64_t EstimateTxSize(size_t inputCount, size_t outputCount);

    /// Greedy largest-first selection. The fee bound assumes a recipient and a change output
    /// and is recomputed after every added input.
    /// Throws WalletException: ValidationError for a zero target, InsufficientFunds when
    /// the outputs cannot cover target + fee.
    CoinSelection SelectCoins(std::vector<Utxo> utxos, Amount target, Amount feeRate);
} // namespace warden::bitcoin
