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

#include "ethereum_signer.h"

#include "utility/logger.h"

#include <boost/algorithm/string.hpp>

namespace warden::ethereum
{
ByteBuffer SignTransaction(const EthBaseTransaction& tx, const libbitcoin::ec_secret& secret)
{
    auto signedTx = tx.GetRawSigned(secret);
    if (signedTx.empty())
    {
        throw wallet::WalletException(wallet::ErrorCode::CryptoError, wallet::kSigningFailed);
    }
    return signedTx;
}

wallet::Error ConvertBridgeError(const IBridge::Error& error)
{
    switch (error.m_type)
    {
    case IBridge::None:
        return wallet::Error();
    case IBridge::EthError:
        if (boost::algorithm::icontains(error.m_message, "insufficient funds"))
        {
            return wallet::MakeError(wallet::ErrorCode::InsufficientFunds, error.m_message);
        }
        return wallet::MakeError(wallet::ErrorCode::NetworkError, "rpc error: " + error.m_message);
    case IBridge::Timeout:
        return wallet::MakeError(wallet::ErrorCode::NetworkError, "rpc timeout");
    default:
        return wallet::MakeError(wallet::ErrorCode::NetworkError, error.m_message);
    }
}

void EthereumSender::send(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback)
{
    auto sender = std::make_shared<EthereumSender>(std::move(bridge), request, std::move(signFunc), std::move(callback));
    sender->start();
}

EthereumSender::EthereumSender(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback)
    : m_bridge(std::move(bridge))
    , m_request(request)
    , m_signFunc(std::move(signFunc))
    , m_callback(std::move(callback))
{
    m_tx.m_receiveAddress = m_request.m_to;
    m_tx.m_value = m_request.m_value;
    m_tx.m_gas = kTransferGasLimit;
    m_tx.m_chainId = m_request.m_chainId;
}

void EthereumSender::start()
{
    m_bridge->getTransactionCount(m_request.m_from, [sp = shared_from_this()](const IBridge::Error& error, uint64_t txCount)
    {
        sp->onGotTransactionCount(error, txCount);
    });
}

void EthereumSender::onGotTransactionCount(const IBridge::Error& error, uint64_t txCount)
{
    if (error.m_type != IBridge::None)
    {
        complete(ConvertBridgeError(error), "");
        return;
    }

    m_tx.m_nonce = txCount;
    m_bridge->getGasPrice([sp = shared_from_this()](const IBridge::Error& error, const uint256& gasPrice)
    {
        sp->onGotGasPrice(error, gasPrice);
    });
}

void EthereumSender::onGotGasPrice(const IBridge::Error& error, const uint256& gasPrice)
{
    if (error.m_type != IBridge::None)
    {
        complete(ConvertBridgeError(error), "");
        return;
    }

    m_tx.m_gasPrice = gasPrice;

    ByteBuffer signedTx;
    try
    {
        signedTx = m_signFunc(m_tx);
    }
    catch (const wallet::WalletException& ex)
    {
        complete(wallet::MakeError(ex), "");
        return;
    }
    // the signer is not needed anymore
    m_signFunc = nullptr;

    m_bridge->sendRawTransaction(libbitcoin::encode_base16(signedTx), [sp = shared_from_this()](const IBridge::Error& error, const std::string& txHash)
    {
        sp->onSentRawTransaction(error, txHash);
    });
}

void EthereumSender::onSentRawTransaction(const IBridge::Error& error, const std::string& txHash)
{
    if (error.m_type != IBridge::None)
    {
        complete(ConvertBridgeError(error), "");
        return;
    }

    LOG_INFO() << "Ethereum transaction broadcast: " << txHash << " nonce " << m_tx.m_nonce;
    complete(wallet::Error(), txHash);
}

void EthereumSender::complete(const wallet::Error& error, const std::string& txHash)
{
    m_signFunc = nullptr;
    if (m_callback)
    {
        auto callback = std::move(m_callback);
        m_callback = nullptr;
        callback(error, txHash, static_cast<uint64_t>(m_tx.m_nonce));
    }
}
} // namespace warden::ethereum
