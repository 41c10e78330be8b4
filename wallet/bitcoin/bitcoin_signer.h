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

#include "bridge.h"
#include "common.h"
#include "wallet/core/common.h"

#include <functional>
#include <memory>

namespace warden::bitcoin
{
    struct TransferRequest
    {
        std::string m_from;
        std::string m_to;
        Amount m_amount = 0;
        Amount m_feeRate = 10;       // satoshi per byte, used when no estimate is requested or available
        bool m_estimateFee = false;  // ask the indexer first
        uint32_t m_feeTarget = 6;    // blocks
    };

    // Signs every input of the prepared transaction in place. Owns the key for the
    // duration of the call only. Throws wallet::WalletException on failure.
    using SignFunc = std::function<void(libbitcoin::chain::transaction&)>;

    // version 2, locktime 0, recipient output first, change back to changeAddress when above dust.
    // Throws ValidationError for malformed addresses or txids
    libbitcoin::chain::transaction BuildTransaction(const CoinSelection& selection, const std::string& to, Amount amount, const std::string& changeAddress);

    // P2PKH, SIGHASH_ALL. All inputs are spent from the address of the secret. Throws CryptoError
    void SignTransaction(libbitcoin::chain::transaction& tx, const libbitcoin::ec_secret& secret, uint8_t addressVersion);

    wallet::Error ConvertBridgeError(const IBridge::Error& error);

    /// One transfer: [fee estimate] -> unspent outputs -> coin selection -> sign -> broadcast.
    /// Keeps itself alive until the callback is invoked.
    class BitcoinSender : public std::enable_shared_from_this<BitcoinSender>
    {
    public:
        // error, transaction ID, selected coins
        using Callback = std::function<void(const wallet::Error&, const std::string&, const CoinSelection&)>;

        static void send(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback);

        BitcoinSender(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback);

    private:
        void start();
        void requestUnspent();
        void onGotFeeRate(const IBridge::Error& error, Amount feeRate);
        void onGotUnspent(const IBridge::Error& error, const std::vector<Utxo>& utxos);
        void onSentRawTransaction(const IBridge::Error& error, const std::string& txid);
        void complete(const wallet::Error& error, const std::string& txid);

        IBridge::Ptr m_bridge;
        TransferRequest m_request;
        SignFunc m_signFunc;
        Callback m_callback;
        Amount m_feeRate;
        CoinSelection m_selection;
    };
} // namespace warden::bitcoin
