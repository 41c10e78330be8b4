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
#include "http/http_client.h"

#include <nlohmann/json.hpp>

#include <memory>

namespace warden::ethereum
{
// JSON-RPC 2.0 client of one Ethereum-compatible endpoint
class EthereumBridge : public IBridge, public std::enable_shared_from_this<EthereumBridge>
{
public:
    EthereumBridge() = delete;
    EthereumBridge(boost::asio::io_context& ioc, const std::string& rpcUrl, unsigned timeoutMsec);

    void getBalance(const std::string& address, std::function<void(const Error&, const uint256&)> callback) override;
    void getTransactionCount(const std::string& address, std::function<void(const Error&, uint64_t)> callback) override;
    void getGasPrice(std::function<void(const Error&, const uint256&)> callback) override;
    void sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback) override;

    // parses a JSON-RPC reply, exposed for tests
    static Error parseReply(const std::string& response, nlohmann::json& result);

protected:
    void sendRequest(
        const std::string& method,
        const std::string& params,
        std::function<void(const Error&, const nlohmann::json&)> callback);

private:
    HttpClient m_httpClient;
    std::string m_rpcUrl;
    uint64_t m_requestId = 0;
};
} // namespace warden::ethereum
