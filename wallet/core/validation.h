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

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

namespace warden::wallet
{
    using BaseUnits = boost::multiprecision::uint256_t;

    // Strict positive decimal with at most `decimals` fraction digits, converted to base units
    // (wei, satoshi) without floating point. Throws ValidationError.
    BaseUnits ParseAmount(const std::string& amount, unsigned decimals);

    std::string FormatAmount(const BaseUnits& value, unsigned decimals);

    unsigned GetNetworkDecimals(const NetworkInfo& network);

    // Throws ValidationError with a short reason
    void ValidateAddress(const NetworkInfo& network, const std::string& address);
} // namespace warden::wallet
