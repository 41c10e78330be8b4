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

#include "coin_selector.h"
#include "utility/common.h"

#include <memory>
#include <string>
#include <functional>
#include <vector>

namespace warden::bitcoin
{
    class IBridge
    {
    public:
        using Ptr = std::shared_ptr<IBridge>;

        enum ErrorType
        {
            None,
            InvalidResultFormat,
            IOError,
            IndexerError,
            EmptyResult,
            Timeout
        };

        struct Error
        {
            ErrorType m_type;
            std::string m_message;
        };

        virtual ~IBridge() {};

        // error, confirmed unspent outputs of the address
        virtual void listUnspent(const std::string& address, std::function<void(const Error&, const std::vector<Utxo>&)> callback) = 0;
        // error, fee rate in satoshi per byte for confirmation within targetBlocks
        virtual void getFeeRate(uint32_t targetBlocks, std::function<void(const Error&, Amount)> callback) = 0;
        // error, transaction ID
        virtual void sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback) = 0;
    };
} // namespace warden::bitcoin
