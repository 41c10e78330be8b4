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
#include "core/secure_buffer.h"

#include <bitcoin/bitcoin.hpp>
#include <map>
#include <string>
#include <vector>

namespace warden::wallet
{
    // The master key is the account-level secp256k1 secret of every network.
    // Throws ValidationError when the key is not exactly 32 bytes and CryptoError
    // when it is not a valid scalar. The caller owns and wipes `secret`.
    void ExtractSecret(const crypto::SecureBuffer& masterKey, libbitcoin::ec_secret& secret);

    /// Pure function of the key and the network tag.
    /// Ethereum family: EIP-55 checksummed "0x" form. Bitcoin: Base58Check P2PKH.
    /// Throws ValidationError for unsupported networks or malformed keys.
    std::string DeriveAddress(const crypto::SecureBuffer& masterKey, const std::string& network);

    // network tag -> address for every tag in `networks`
    std::map<std::string, std::string> DeriveAllAddresses(const crypto::SecureBuffer& masterKey, const std::vector<std::string>& networks);
} // namespace warden::wallet
