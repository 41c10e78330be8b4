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

#include <stdexcept>

using namespace libbitcoin;
using namespace libbitcoin::wallet;

namespace warden::bitcoin
{
    uint8_t getAddressVersion()
    {
        return kMainnetAddressVersion;
    }

    ec_public getPublicKey(const ec_secret& secret)
    {
        ec_compressed point;
        if (!secret_to_public(point, secret))
        {
            throw std::invalid_argument("invalid secret key");
        }
        return ec_public(point, true);
    }

    std::string getAddressFromSecret(const ec_secret& secret, uint8_t addressVersion)
    {
        return getPublicKey(secret).to_payment_address(addressVersion).encoded();
    }

    bool isValidAddress(const std::string& address, uint8_t addressVersion)
    {
        payment_address decoded(address);
        return decoded && decoded.version() == addressVersion;
    }
} // namespace warden::bitcoin
