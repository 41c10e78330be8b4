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

#include "blockstream_bridge.h"

#include "utility/logger.h"
#include "wallet/core/sanitizer.h"

#include <nlohmann/json.hpp>

#include <boost/algorithm/string.hpp>
#include <cmath>

using json = nlohmann::json;

namespace warden::bitcoin
{
    namespace
    {
        const size_t kTxIdSize = 64;
    }

    BlockstreamBridge::BlockstreamBridge(boost::asio::io_context& ioc, const std::string& baseUrl, unsigned timeoutMsec)
        : m_httpClient(ioc, timeoutMsec)
        , m_baseUrl(boost::algorithm::trim_right_copy_if(baseUrl, boost::is_any_of("/")))
    {
    }

    void BlockstreamBridge::listUnspent(const std::string& address, std::function<void(const Error&, const std::vector<Utxo>&)> callback)
    {
        LOG_DEBUG() << "listUnspent command";

        sendRequest(false, "/address/" + address + "/utxo", "", [callback](Error error, const std::string& response)
        {
            std::vector<Utxo> utxos;
            if (error.m_type == IBridge::None)
            {
                error = parseUtxoList(response, utxos);
            }
            callback(error, utxos);
        });
    }

    void BlockstreamBridge::getFeeRate(uint32_t targetBlocks, std::function<void(const Error&, Amount)> callback)
    {
        LOG_DEBUG() << "getFeeRate command";

        sendRequest(false, "/fee-estimates", "", [callback, targetBlocks](Error error, const std::string& response)
        {
            Amount feeRate = 0;
            if (error.m_type == IBridge::None)
            {
                error = parseFeeEstimates(response, targetBlocks, feeRate);
            }
            callback(error, feeRate);
        });
    }

    void BlockstreamBridge::sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback)
    {
        LOG_DEBUG() << "sendRawTransaction command";

        sendRequest(true, "/tx", rawTx, [callback](Error error, const std::string& response)
        {
            std::string txid;
            if (error.m_type == IBridge::None)
            {
                error = parseTxId(response, txid);
            }
            callback(error, txid);
        });
    }

    IBridge::Error BlockstreamBridge::parseUtxoList(const std::string& response, std::vector<Utxo>& utxos)
    {
        Error error{ None, "" };
        utxos.clear();
        try
        {
            auto reply = json::parse(response);
            if (!reply.is_array())
            {
                return Error{ InvalidResultFormat, "utxo list is not an array" };
            }

            for (const auto& item : reply)
            {
                const auto& status = item.at("status");
                if (!status.value("confirmed", false))
                {
                    continue;
                }

                Utxo utxo;
                utxo.m_txid = item.at("txid").get<std::string>();
                utxo.m_vout = item.at("vout").get<uint32_t>();
                utxo.m_value = item.at("value").get<Amount>();
                utxos.push_back(std::move(utxo));
            }
        }
        catch (const std::exception& ex)
        {
            utxos.clear();
            error.m_type = InvalidResultFormat;
            error.m_message = ex.what();
        }
        return error;
    }

    IBridge::Error BlockstreamBridge::parseFeeEstimates(const std::string& response, uint32_t targetBlocks, Amount& feeRate)
    {
        Error error{ None, "" };
        try
        {
            auto reply = json::parse(response);

            // the closest target not faster than the requested one
            bool found = false;
            uint32_t bestTarget = 0;
            double bestRate = 0;
            for (auto it = reply.begin(); it != reply.end(); ++it)
            {
                uint32_t target = static_cast<uint32_t>(std::stoul(it.key()));
                if (target >= targetBlocks && (!found || target < bestTarget))
                {
                    found = true;
                    bestTarget = target;
                    bestRate = it.value().get<double>();
                }
            }

            if (!found)
            {
                return Error{ EmptyResult, "no fee estimate for target" };
            }

            feeRate = static_cast<Amount>(std::ceil(bestRate));
            if (feeRate == 0)
            {
                feeRate = 1;
            }
        }
        catch (const std::exception& ex)
        {
            error.m_type = InvalidResultFormat;
            error.m_message = ex.what();
        }
        return error;
    }

    IBridge::Error BlockstreamBridge::parseTxId(const std::string& response, std::string& txid)
    {
        auto trimmed = boost::algorithm::trim_copy(response);
        if (trimmed.size() != kTxIdSize || !std::all_of(trimmed.begin(), trimmed.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }))
        {
            return Error{ IndexerError, trimmed };
        }
        txid = trimmed;
        return Error{ None, "" };
    }

    void BlockstreamBridge::sendRequest(bool isPost, const std::string& path, const std::string& body, Handler handler)
    {
        auto onResponse = [handler, weak = weak_from_this()](const boost::system::error_code& ec, const HttpResponse& response)
        {
            if (weak.expired())
            {
                return;
            }

            if (ec)
            {
                handler(Error{ IsTimeout(ec) ? Timeout : IOError, wallet::SanitizeMessage(ec.message()) }, "");
                return;
            }

            if (!response.isSuccess())
            {
                // esplora reports rejections as plain text
                handler(Error{ IndexerError, wallet::SanitizeMessage(response.m_body.empty() ? "http status " + std::to_string(response.m_status) : response.m_body) }, "");
                return;
            }

            handler(Error{ None, "" }, response.m_body);
        };

        const std::string url = m_baseUrl + path;
        if (isPost)
        {
            m_httpClient.post(url, "text/plain", body, std::move(onResponse));
        }
        else
        {
            m_httpClient.get(url, std::move(onResponse));
        }
    }
} // namespace warden::bitcoin
