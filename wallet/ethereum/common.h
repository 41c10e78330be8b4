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

#include <string>
#include <bitcoin/bitcoin.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include "utility/common.h"

namespace warden::ethereum
{
using uint256 = boost::multiprecision::uint256_t;

inline constexpr uint64_t kTransferGasLimit = 21000;
inline constexpr unsigned kEthDecimals = 18;

std::string ConvertEthAddressToStr(const libbitcoin::short_hash& addr);
// EIP-55 mixed case form
std::string ConvertEthAddressToChecksumStr(const libbitcoin::short_hash& addr);
// throws std::invalid_argument
libbitcoin::short_hash ConvertStrToEthAddress(const std::string& addressStr);
// "0x" + 40 hex, all lower, all upper or a matching EIP-55 checksum
bool IsValidEthAddress(const std::string& addressStr);

libbitcoin::hash_digest Keccak256(const uint8_t* data, size_t size);
libbitcoin::short_hash GetEthAddressFromPubkey(const libbitcoin::ec_uncompressed& pubkey);
// throws std::invalid_argument if the secret is not a valid secp256k1 scalar
libbitcoin::short_hash GetEthAddressFromSecret(const libbitcoin::ec_secret& secret);

uint256 ConvertStrToUint256(const std::string& number, bool hex = true);
std::string ConvertUint256ToHexStr(const uint256& value);
// big-endian without leading zeros, empty for zero
ByteBuffer ConvertUint256ToBytes(const uint256& value);
uint256 ConvertBytesToUint256(const uint8_t* data, size_t size);

std::string AddHexPrefix(const std::string& value);
std::string RemoveHexPrefix(const std::string& value);
} // namespace warden::ethereum
