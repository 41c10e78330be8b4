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
#include <bitcoin/bitcoin.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <ethash/keccak.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace
{
    const std::string kHexPrefix = "0x";
    const size_t kAddressHexSize = 40;

    bool HasHexPrefix(const std::string& value)
    {
        return value.find(kHexPrefix) == 0 || value.find("0X") == 0;
    }
}

namespace warden::ethereum
{
std::string ConvertEthAddressToStr(const libbitcoin::short_hash& addr)
{
    return kHexPrefix + libbitcoin::encode_base16(addr);
}

std::string ConvertEthAddressToChecksumStr(const libbitcoin::short_hash& addr)
{
    std::string hex = libbitcoin::encode_base16(addr);
    auto hash = Keccak256(reinterpret_cast<const uint8_t*>(hex.data()), hex.size());

    for (size_t i = 0; i < hex.size(); ++i)
    {
        uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        if (nibble >= 8)
        {
            hex[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i])));
        }
    }
    return kHexPrefix + hex;
}

libbitcoin::short_hash ConvertStrToEthAddress(const std::string& addressStr)
{
    auto hex = RemoveHexPrefix(addressStr);
    libbitcoin::short_hash address;
    if (hex.size() != kAddressHexSize || !libbitcoin::decode_base16(address, hex))
    {
        throw std::invalid_argument("invalid ethereum address");
    }
    return address;
}

bool IsValidEthAddress(const std::string& addressStr)
{
    if (addressStr.size() != kHexPrefix.size() + kAddressHexSize || addressStr.compare(0, 2, kHexPrefix) != 0)
    {
        return false;
    }

    auto hex = addressStr.substr(2);
    if (!std::all_of(hex.begin(), hex.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }))
    {
        return false;
    }

    bool hasLower = std::any_of(hex.begin(), hex.end(), [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; });
    bool hasUpper = std::any_of(hex.begin(), hex.end(), [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; });
    if (!hasLower || !hasUpper)
    {
        return true;
    }

    return ConvertEthAddressToChecksumStr(ConvertStrToEthAddress(addressStr)) == addressStr;
}

libbitcoin::hash_digest Keccak256(const uint8_t* data, size_t size)
{
    auto hash = ethash::keccak256(data, size);
    libbitcoin::hash_digest res;
    std::copy(std::begin(hash.bytes), std::end(hash.bytes), res.begin());
    return res;
}

libbitcoin::short_hash GetEthAddressFromPubkey(const libbitcoin::ec_uncompressed& pubkey)
{
    // skip the 0x04 prefix
    auto hash = Keccak256(pubkey.data() + 1, pubkey.size() - 1);
    libbitcoin::short_hash address;

    std::copy_n(&hash[12], 20, address.begin());
    return address;
}

libbitcoin::short_hash GetEthAddressFromSecret(const libbitcoin::ec_secret& secret)
{
    libbitcoin::ec_uncompressed point;
    if (!libbitcoin::secret_to_public(point, secret))
    {
        throw std::invalid_argument("invalid secret key");
    }
    return GetEthAddressFromPubkey(point);
}

uint256 ConvertStrToUint256(const std::string& number, bool hex)
{
    if (hex)
    {
        auto digits = RemoveHexPrefix(number);
        if (digits.empty())
        {
            return 0;
        }
        return uint256(kHexPrefix + digits);
    }

    return uint256(number);
}

std::string ConvertUint256ToHexStr(const uint256& value)
{
    std::stringstream stream;
    stream << std::hex << value;
    return kHexPrefix + stream.str();
}

ByteBuffer ConvertUint256ToBytes(const uint256& value)
{
    ByteBuffer out;
    boost::multiprecision::export_bits(value, std::back_inserter(out), 8);
    // export_bits writes a single zero byte for zero
    auto firstNonZero = std::find_if(out.begin(), out.end(), [](uint8_t b) { return b != 0; });
    out.erase(out.begin(), firstNonZero);
    return out;
}

uint256 ConvertBytesToUint256(const uint8_t* data, size_t size)
{
    uint256 value;
    boost::multiprecision::import_bits(value, data, data + size, 8);
    return value;
}

std::string AddHexPrefix(const std::string& value)
{
    if (!HasHexPrefix(value))
    {
        return kHexPrefix + value;
    }

    return value;
}

std::string RemoveHexPrefix(const std::string& value)
{
    if (HasHexPrefix(value))
    {
        return std::string(value.begin() + 2, value.end());
    }

    return value;
}
} // namespace warden::ethereum
