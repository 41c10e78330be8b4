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

#include "validation.h"

#include "wallet/bitcoin/common.h"
#include "wallet/ethereum/common.h"

#include <limits>
#include <regex>

namespace warden::wallet
{
    namespace
    {
        const size_t kMaxAmountDigits = 60;

        BaseUnits Pow10(unsigned exponent)
        {
            BaseUnits result = 1;
            for (unsigned i = 0; i < exponent; ++i)
            {
                result *= 10;
            }
            return result;
        }
    }

    BaseUnits ParseAmount(const std::string& amount, unsigned decimals)
    {
        static const std::regex kAmountRegex("^(0|[1-9][0-9]*)(\\.([0-9]+))?$");

        std::smatch match;
        if (amount.size() > kMaxAmountDigits || !std::regex_match(amount, match, kAmountRegex))
        {
            throw WalletException(ErrorCode::ValidationError, "invalid amount format");
        }

        std::string fraction = match[3].str();
        if (fraction.size() > decimals)
        {
            throw WalletException(ErrorCode::ValidationError, "too many decimal places, at most " + std::to_string(decimals));
        }
        fraction.append(decimals - fraction.size(), '0');

        boost::multiprecision::cpp_int value(match[1].str());
        value *= boost::multiprecision::cpp_int(Pow10(decimals));
        if (!fraction.empty())
        {
            value += boost::multiprecision::cpp_int(fraction);
        }

        if (value == 0)
        {
            throw WalletException(ErrorCode::ValidationError, "amount must be positive");
        }
        if (value > boost::multiprecision::cpp_int(std::numeric_limits<BaseUnits>::max()))
        {
            throw WalletException(ErrorCode::ValidationError, "amount is too large");
        }
        return value.convert_to<BaseUnits>();
    }

    std::string FormatAmount(const BaseUnits& value, unsigned decimals)
    {
        const auto divisor = Pow10(decimals);
        std::string result = (value / divisor).str();

        std::string fraction = (value % divisor).str();
        if (decimals == 0 || fraction == "0")
        {
            return result;
        }

        fraction.insert(0, decimals - fraction.size(), '0');
        fraction.erase(fraction.find_last_not_of('0') + 1);
        return result + "." + fraction;
    }

    unsigned GetNetworkDecimals(const NetworkInfo& network)
    {
        return network.m_type == NetworkType::Bitcoin ? bitcoin::kBtcDecimals : ethereum::kEthDecimals;
    }

    void ValidateAddress(const NetworkInfo& network, const std::string& address)
    {
        switch (network.m_type)
        {
        case NetworkType::Ethereum:
            if (!ethereum::IsValidEthAddress(address))
            {
                throw WalletException(ErrorCode::ValidationError, "invalid ethereum address");
            }
            return;
        case NetworkType::Bitcoin:
            if (!bitcoin::isValidAddress(address, bitcoin::getAddressVersion()))
            {
                throw WalletException(ErrorCode::ValidationError, "invalid bitcoin address");
            }
            return;
        }
        throw WalletException(ErrorCode::ValidationError, "unsupported network: " + network.m_tag);
    }
} // namespace warden::wallet
