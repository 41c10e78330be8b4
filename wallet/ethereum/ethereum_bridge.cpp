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

#include "ethereum_bridge.h"

#include "utility/logger.h"
#include "wallet/core/sanitizer.h"

#include <boost/format.hpp>

using json = nlohmann::json;

namespace warden::ethereum
{
EthereumBridge::EthereumBridge(boost::asio::io_context& ioc, const std::string& rpcUrl, unsigned timeoutMsec)
    : m_httpClient(ioc, timeoutMsec)
    , m_rpcUrl(rpcUrl)
{
}

void EthereumBridge::getBalance(const std::string& address, std::function<void(const Error&, const uint256&)> callback)
{
    LOG_DEBUG() << "EthereumBridge::getBalance";
    std::string params = (boost::format(R"("%1%","latest")") % address).str();

    sendRequest("eth_getBalance", params, [callback](Error error, const json& result)
    {
        LOG_DEBUG() << "EthereumBridge::getBalance in";
        uint256 balance = 0;

        if (error.m_type == IBridge::None)
        {
            try
            {
                balance = ConvertStrToUint256(result["result"].get<std::string>());
            }
            catch (const std::exception& ex)
            {
                error.m_type = IBridge::InvalidResultFormat;
                error.m_message = ex.what();
            }
        }
        callback(error, balance);
    });
}

void EthereumBridge::getTransactionCount(const std::string& address, std::function<void(const Error&, uint64_t)> callback)
{
    LOG_DEBUG() << "EthereumBridge::getTransactionCount";
    std::string params = (boost::format(R"("%1%","pending")") % address).str();

    sendRequest("eth_getTransactionCount", params, [callback](Error error, const json& result)
    {
        LOG_DEBUG() << "EthereumBridge::getTransactionCount in";
        uint64_t txCount = 0;

        if (error.m_type == IBridge::None)
        {
            try
            {
                std::string st = result["result"].get<std::string>();
                txCount = std::stoull(st, nullptr, 16);
            }
            catch (const std::exception& ex)
            {
                error.m_type = IBridge::InvalidResultFormat;
                error.m_message = ex.what();
            }
        }
        callback(error, txCount);
    });
}

void EthereumBridge::getGasPrice(std::function<void(const Error&, const uint256&)> callback)
{
    LOG_DEBUG() << "EthereumBridge::getGasPrice";
    sendRequest("eth_gasPrice", "", [callback](Error error, const json& result)
    {
        LOG_DEBUG() << "EthereumBridge::getGasPrice in";
        uint256 gasPrice = 0;

        if (error.m_type == IBridge::None)
        {
            try
            {
                gasPrice = ConvertStrToUint256(result["result"].get<std::string>());
            }
            catch (const std::exception& ex)
            {
                error.m_type = IBridge::InvalidResultFormat;
                error.m_message = ex.what();
            }
        }

        callback(error, gasPrice);
    });
}

void EthereumBridge::sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback)
{
    LOG_DEBUG() << "EthereumBridge::sendRawTransaction";
    std::string params = (boost::format(R"("%1%")") % AddHexPrefix(rawTx)).str();

    sendRequest("eth_sendRawTransaction", params, [callback](Error error, const json& result)
    {
        LOG_DEBUG() << "EthereumBridge::sendRawTransaction in";
        std::string txHash = "";

        if (error.m_type == IBridge::None)
        {
            try
            {
                txHash = result["result"].get<std::string>();
            }
            catch (const std::exception& ex)
            {
                error.m_type = IBridge::InvalidResultFormat;
                error.m_message = ex.what();
            }
        }

        callback(error, txHash);
    });
}

IBridge::Error EthereumBridge::parseReply(const std::string& response, json& result)
{
    Error error{ None, "" };
    if (response.empty())
    {
        error.m_type = InvalidResultFormat;
        error.m_message = "Empty response.";
        return error;
    }

    try
    {
        json reply = json::parse(response);
        if (reply.contains("error") && !reply["error"].is_null())
        {
            error.m_type = EthError;
            error.m_message = reply["error"].value("message", std::string("unknown error"));
        }
        else if (!reply.contains("result") || reply["result"].is_null())
        {
            error.m_type = EmptyResult;
            error.m_message = "JSON has no \"result\" value";
        }
        else
        {
            result = std::move(reply);
        }
    }
    catch (const std::exception& ex)
    {
        error.m_type = InvalidResultFormat;
        error.m_message = ex.what();
    }
    return error;
}

void EthereumBridge::sendRequest(
    const std::string& method,
    const std::string& params,
    std::function<void(const Error&, const nlohmann::json&)> callback)
{
    const std::string content = (boost::format(R"({"jsonrpc":"2.0","method":"%1%","params":[%2%],"id":%3%})") % method % params % ++m_requestId).str();

    LOG_DEBUG() << "sendRequest: " << method;

    m_httpClient.post(m_rpcUrl, "application/json", content,
        [callback, weak = weak_from_this()](const boost::system::error_code& ec, const HttpResponse& response)
    {
        if (weak.expired())
        {
            return;
        }

        json result;
        if (ec)
        {
            Error error{ IsTimeout(ec) ? Timeout : IOError, wallet::SanitizeMessage(ec.message()) };
            callback(error, result);
            return;
        }

        if (!response.isSuccess() && response.m_body.empty())
        {
            Error error{ IOError, "http status " + std::to_string(response.m_status) };
            callback(error, result);
            return;
        }

        auto error = parseReply(response.m_body, result);
        callback(error, result);
    });
}
} // namespace warden::ethereum
