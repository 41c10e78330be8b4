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

#include "common.h"

#include <functional>
#include <memory>
#include <string>

namespace warden::ethereum
{
class IBridge
{
public:
    enum ErrorType
    {
        None,
        InvalidResultFormat,
        IOError,
        EthError,
        EmptyResult,
        Timeout
    };

    struct Error
    {
        ErrorType m_type;
        std::string m_message;
    };

    using Ptr = std::shared_ptr<IBridge>;
    virtual ~IBridge() {};

    // balance in wei
    virtual void getBalance(const std::string& address, std::function<void(const Error&, const uint256&)> callback) = 0;
    // nonce including pending transactions
    virtual void getTransactionCount(const std::string& address, std::function<void(const Error&, uint64_t)> callback) = 0;
    virtual void getGasPrice(std::function<void(const Error&, const uint256&)> callback) = 0;
    // error, transaction hash
    virtual void sendRawTransaction(const std::string& rawTx, std::function<void(const Error&, const std::string&)> callback) = 0;
};
} // namespace warden::ethereum
