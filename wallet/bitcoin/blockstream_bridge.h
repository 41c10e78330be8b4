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

namespace warden::bitcoin
{
    /// Esplora REST client (blockstream.info compatible)
    class BlockstreamBridge : public IBridge, public std::enable_shared_from_this<BlockstreamBridge>
    {
    public:
        BlockstreamBridge() = delete;
        BlockstreamBridge(boost::asio::io_context& ioc, const std::string& baseUrl, unsigned timeoutMsec);

        void listUnspent(const std::string& address, std::function<void(const Error&, const std::vector<Utxo>&)> callback) override;
        void getFeeRate(uint32_t targetBlocks, std::function<void(const Error&, Amount)> callback) override;
        void sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback) override;

        // response parsers, exposed for tests
        static Error parseUtxoList(const std::string& response, std::vector<Utxo>& utxos);
        static Error parseFeeEstimates(const std::string& response, uint32_t targetBlocks, Amount& feeRate);
        static Error parseTxId(const std::string& response, std::string& txid);

    private:
        using Handler = std::function<void(const Error&, const std::string&)>;
        void sendRequest(bool isPost, const std::string& path, const std::string& body, Handler handler);

        HttpClient m_httpClient;
        std::string m_baseUrl;
    };
} // namespace warden::bitcoin
