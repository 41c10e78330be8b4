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

#include <stdint.h>
#include <string>
#include <bitcoin/bitcoin.hpp>

namespace warden::bitcoin
{
    constexpr uint32_t kTransactionVersion = 2;
    constexpr uint32_t kTransactionLocktime = 0;
    constexpr uint64_t kDustThreshold = 546;
    constexpr unsigned kBtcDecimals = 8;
    constexpr uint8_t kMainnetAddressVersion = 0x00;

    uint8_t getAddressVersion();

    // compressed public key, P2PKH, throws std::invalid_argument for invalid secrets
    libbitcoin::wallet::ec_public getPublicKey(const libbitcoin::ec_secret& secret);
    std::string getAddressFromSecret(const libbitcoin::ec_secret& secret, uint8_t addressVersion);

    // Base58Check decodes and carries the expected version byte
    bool isValidAddress(const std::string& address, uint8_t addressVersion);
} // namespace warden::bitcoin
