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
#include "ethereum_transaction.h"
#include "wallet/core/common.h"

#include <functional>
#include <memory>

namespace warden::ethereum
{
struct TransferRequest
{
    std::string m_from;
    libbitcoin::short_hash m_to;
    uint256 m_value = 0;
    uint64_t m_chainId = 1;
};

// Produces the signed RLP for a prepared transaction. Owns the key for the duration
// of the call only. Throws wallet::WalletException on failure.
using SignFunc = std::function<ByteBuffer(const EthBaseTransaction&)>;

// Signs with a raw secp256k1 key, throws CryptoError
ByteBuffer SignTransaction(const EthBaseTransaction& tx, const libbitcoin::ec_secret& secret);

wallet::Error ConvertBridgeError(const IBridge::Error& error);

/// One native transfer: chain nonce -> gas price -> sign -> broadcast.
/// Keeps itself alive until the callback is invoked.
class EthereumSender : public std::enable_shared_from_this<EthereumSender>
{
public:
    // error, transaction hash, chain nonce
    using Callback = std::function<void(const wallet::Error&, const std::string&, uint64_t)>;

    static void send(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback);

    EthereumSender(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback);

private:
    void start();
    void onGotTransactionCount(const IBridge::Error& error, uint64_t txCount);
    void onGotGasPrice(const IBridge::Error& error, const uint256& gasPrice);
    void onSentRawTransaction(const IBridge::Error& error, const std::string& txHash);
    void complete(const wallet::Error& error, const std::string& txHash);

    IBridge::Ptr m_bridge;
    TransferRequest m_request;
    SignFunc m_signFunc;
    Callback m_callback;
    EthBaseTransaction m_tx;
};
} // namespace warden::ethereum
