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

#include "utility/common.h"

#include <boost/optional.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::wallet
{
    enum class ErrorCode
    {
        None,
        NotFound,
        ValidationError,
        AlreadyExists,
        CryptoError,
        NetworkError,
        InsufficientFunds,
        CapacityFull,
        NonceOverflow,
        StorageError
    };

    const char* GetErrorCodeName(ErrorCode code);

    // Fixed texts for crypto failures, they never say why the operation failed
    extern const char kDecryptionFailed[];
    extern const char kSigningFailed[];

    class WalletException : public std::runtime_error
    {
    public:
        // message is sanitized before it is stored
        WalletException(ErrorCode code, const std::string& message);

        ErrorCode code() const { return m_code; }
        bool isRetryable() const { return m_code == ErrorCode::NetworkError; }

    private:
        ErrorCode m_code;
    };

    // Result of an asynchronous operation
    struct Error
    {
        ErrorCode m_type = ErrorCode::None;
        std::string m_message;

        bool isOk() const { return m_type == ErrorCode::None; }
        bool isRetryable() const { return m_type == ErrorCode::NetworkError; }
    };

    Error MakeError(ErrorCode code, const std::string& message);
    Error MakeError(const WalletException& ex);

    std::ostream& operator<<(std::ostream& os, const Error& error);

    enum class NetworkType
    {
        Ethereum,
        Bitcoin
    };

    struct NetworkInfo
    {
        std::string m_tag;
        NetworkType m_type;
        uint64_t m_chainId;
        std::string m_defaultRpc;
    };

    // Accepts aliases ("eth", "btc") in any case
    boost::optional<NetworkInfo> FindNetwork(const std::string& tag);

    // Throws ValidationError for unknown tags
    NetworkInfo GetNetwork(const std::string& tag);

    // Canonical tags of all built-in networks
    std::vector<std::string> GetSupportedNetworks();

    constexpr uint64_t kEthereumMainnetChainId = 1;
    extern const char kDefaultBitcoinIndexer[];
} // namespace warden::wallet
