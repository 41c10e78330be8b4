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

#include "common.h"
#include "sanitizer.h"

#include <boost/algorithm/string.hpp>
#include <ostream>

namespace warden::wallet
{
    namespace
    {
        const NetworkInfo kNetworks[] =
        {
            { "ethereum", NetworkType::Ethereum, kEthereumMainnetChainId, "https://eth.llamarpc.com" },
            { "sepolia", NetworkType::Ethereum, 11155111, "https://rpc.sepolia.org" },
            { "polygon", NetworkType::Ethereum, 137, "https://polygon-rpc.com" },
            { "bsc", NetworkType::Ethereum, 56, "https://bsc-dataseed.binance.org" },
            { "bitcoin", NetworkType::Bitcoin, 0, kDefaultBitcoinIndexer }
        };
    }

    const char kDecryptionFailed[] = "decryption failed";
    const char kSigningFailed[] = "signing failed";
    const char kDefaultBitcoinIndexer[] = "https://blockstream.info/api";

    const char* GetErrorCodeName(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None: return "None";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::CryptoError: return "CryptoError";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::CapacityFull: return "CapacityFull";
        case ErrorCode::NonceOverflow: return "NonceOverflow";
        case ErrorCode::StorageError: return "StorageError";
        }
        return "Unknown";
    }

    WalletException::WalletException(ErrorCode code, const std::string& message)
        : std::runtime_error(SanitizeMessage(message))
        , m_code(code)
    {
    }

    Error MakeError(ErrorCode code, const std::string& message)
    {
        return Error{ code, SanitizeMessage(message) };
    }

    Error MakeError(const WalletException& ex)
    {
        return Error{ ex.code(), ex.what() };
    }

    std::ostream& operator<<(std::ostream& os, const Error& error)
    {
        os << GetErrorCodeName(error.m_type);
        if (!error.m_message.empty())
        {
            os << ": " << error.m_message;
        }
        return os;
    }

    boost::optional<NetworkInfo> FindNetwork(const std::string& tag)
    {
        std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(tag));
        if (name == "eth")
        {
            name = "ethereum";
        }
        else if (name == "btc")
        {
            name = "bitcoin";
        }

        for (const auto& network : kNetworks)
        {
            if (network.m_tag == name)
            {
                return network;
            }
        }
        return {};
    }

    NetworkInfo GetNetwork(const std::string& tag)
    {
        auto network = FindNetwork(tag);
        if (!network)
        {
            throw WalletException(ErrorCode::ValidationError, "unsupported network: " + tag);
        }
        return *network;
    }

    std::vector<std::string> GetSupportedNetworks()
    {
        std::vector<std::string> res;
        for (const auto& network : kNetworks)
        {
            res.push_back(network.m_tag);
        }
        return res;
    }
} // namespace warden::wallet
