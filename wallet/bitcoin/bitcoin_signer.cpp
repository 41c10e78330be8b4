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

#include "bitcoin_signer.h"

#include "utility/logger.h"

#include <boost/algorithm/string.hpp>

using namespace libbitcoin;
using namespace libbitcoin::chain;

namespace warden::bitcoin
{
    namespace
    {
        script MakeLockingScript(const libbitcoin::wallet::payment_address& address)
        {
            return script(script::to_pay_key_hash_pattern(address.hash()));
        }

        libbitcoin::wallet::payment_address DecodeAddress(const std::string& address)
        {
            libbitcoin::wallet::payment_address decoded(address);
            if (!decoded)
            {
                throw warden::wallet::WalletException(warden::wallet::ErrorCode::ValidationError, "invalid bitcoin address");
            }
            return decoded;
        }
    }

    transaction BuildTransaction(const CoinSelection& selection, const std::string& to, Amount amount, const std::string& changeAddress)
    {
        auto destination = DecodeAddress(to);

        transaction tx;
        tx.set_version(kTransactionVersion);
        tx.set_locktime(kTransactionLocktime);

        for (const auto& utxo : selection.m_selected)
        {
            hash_digest txHash;
            if (!decode_hash(txHash, utxo.m_txid))
            {
                throw warden::wallet::WalletException(warden::wallet::ErrorCode::ValidationError, "invalid utxo txid");
            }

            input in;
            in.set_previous_output(output_point(txHash, utxo.m_vout));
            in.set_sequence(max_input_sequence);
            tx.inputs().push_back(in);
        }

        tx.outputs().push_back(output(amount, MakeLockingScript(destination)));

        if (selection.m_change > 0)
        {
            tx.outputs().push_back(output(selection.m_change, MakeLockingScript(DecodeAddress(changeAddress))));
        }

        return tx;
    }

    void SignTransaction(transaction& tx, const ec_secret& secret, uint8_t addressVersion)
    {
        libbitcoin::wallet::ec_public publicKey;
        try
        {
            publicKey = getPublicKey(secret);
        }
        catch (const std::invalid_argument&)
        {
            throw warden::wallet::WalletException(warden::wallet::ErrorCode::CryptoError, warden::wallet::kSigningFailed);
        }

        auto lockingScript = MakeLockingScript(publicKey.to_payment_address(addressVersion));

        data_chunk publicKeyData;
        publicKey.to_data(publicKeyData);

        for (uint32_t index = 0; index < tx.inputs().size(); ++index)
        {
            endorsement sig;
            if (!script::create_endorsement(sig, secret, lockingScript, tx, index, machine::sighash_algorithm::all))
            {
                throw warden::wallet::WalletException(warden::wallet::ErrorCode::CryptoError, warden::wallet::kSigningFailed);
            }

            machine::operation::list sigScript;
            sigScript.push_back(machine::operation(sig));
            sigScript.push_back(machine::operation(publicKeyData));
            tx.inputs()[index].set_script(script(sigScript));
        }
    }

    wallet::Error ConvertBridgeError(const IBridge::Error& error)
    {
        switch (error.m_type)
        {
        case IBridge::None:
            return wallet::Error();
        case IBridge::IndexerError:
            if (boost::algorithm::icontains(error.m_message, "insufficient"))
            {
                return wallet::MakeError(wallet::ErrorCode::InsufficientFunds, error.m_message);
            }
            return wallet::MakeError(wallet::ErrorCode::NetworkError, "indexer error: " + error.m_message);
        case IBridge::Timeout:
            return wallet::MakeError(wallet::ErrorCode::NetworkError, "indexer timeout");
        default:
            return wallet::MakeError(wallet::ErrorCode::NetworkError, error.m_message);
        }
    }

    void BitcoinSender::send(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback)
    {
        auto sender = std::make_shared<BitcoinSender>(std::move(bridge), request, std::move(signFunc), std::move(callback));
        sender->start();
    }

    BitcoinSender::BitcoinSender(IBridge::Ptr bridge, const TransferRequest& request, SignFunc signFunc, Callback callback)
        : m_bridge(std::move(bridge))
        , m_request(request)
        , m_signFunc(std::move(signFunc))
        , m_callback(std::move(callback))
        , m_feeRate(request.m_feeRate)
    {
    }

    void BitcoinSender::start()
    {
        if (!m_request.m_estimateFee)
        {
            requestUnspent();
            return;
        }

        m_bridge->getFeeRate(m_request.m_feeTarget, [sp = shared_from_this()](const IBridge::Error& error, Amount feeRate)
        {
            sp->onGotFeeRate(error, feeRate);
        });
    }

    void BitcoinSender::onGotFeeRate(const IBridge::Error& error, Amount feeRate)
    {
        if (error.m_type != IBridge::None || feeRate == 0)
        {
            LOG_WARNING() << "Fee estimate unavailable, using fixed rate " << m_feeRate << " sat/B";
        }
        else
        {
            m_feeRate = feeRate;
        }
        requestUnspent();
    }

    void BitcoinSender::requestUnspent()
    {
        m_bridge->listUnspent(m_request.m_from, [sp = shared_from_this()](const IBridge::Error& error, const std::vector<Utxo>& utxos)
        {
            sp->onGotUnspent(error, utxos);
        });
    }

    void BitcoinSender::onGotUnspent(const IBridge::Error& error, const std::vector<Utxo>& utxos)
    {
        if (error.m_type != IBridge::None)
        {
            complete(ConvertBridgeError(error), "");
            return;
        }

        std::string rawTx;
        try
        {
            m_selection = SelectCoins(utxos, m_request.m_amount, m_feeRate);
            auto tx = BuildTransaction(m_selection, m_request.m_to, m_request.m_amount, m_request.m_from);
            m_signFunc(tx);
            rawTx = encode_base16(tx.to_data());
        }
        catch (const wallet::WalletException& ex)
        {
            complete(wallet::MakeError(ex), "");
            return;
        }
        m_signFunc = nullptr;

        LOG_DEBUG() << "Bitcoin transaction: " << m_selection.m_selected.size() << " inputs, fee " << m_selection.m_fee;

        m_bridge->sendRawTransaction(rawTx, [sp = shared_from_this()](const IBridge::Error& error, const std::string& txid)
        {
            sp->onSentRawTransaction(error, txid);
        });
    }

    void BitcoinSender::onSentRawTransaction(const IBridge::Error& error, const std::string& txid)
    {
        if (error.m_type != IBridge::None)
        {
            complete(ConvertBridgeError(error), "");
            return;
        }

        LOG_INFO() << "Bitcoin transaction broadcast: " << txid;
        complete(wallet::Error(), txid);
    }

    void BitcoinSender::complete(const wallet::Error& error, const std::string& txid)
    {
        m_signFunc = nullptr;
        if (m_callback)
        {
            auto callback = std::move(m_callback);
            m_callback = nullptr;
            callback(error, txid, m_selection);
        }
    }
} // namespace warden::bitcoin
