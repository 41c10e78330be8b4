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
#include <bitcoin/bitcoin.hpp>

#include "common.h"

namespace warden::ethereum
{

// Native-asset transfer, legacy format with EIP-155 replay protection
struct EthBaseTransaction
{
    libbitcoin::short_hash m_receiveAddress;
    uint256 m_value = 0;
    ByteBuffer m_data;
    uint256 m_nonce = 0;
    uint256 m_gas = kTransferGasLimit;
    uint256 m_gasPrice = 0;
    uint64_t m_chainId = 1;

    // RLP([nonce, gasPrice, gas, to, value, data, chainId, 0, 0])
    ByteBuffer GetSigningPayload() const;
    libbitcoin::hash_digest GetSigningHash() const;

    // empty buffer if signing failed
    ByteBuffer GetRawSigned(const libbitcoin::ec_secret& secret) const;
    bool Sign(libbitcoin::recoverable_signature& out, const libbitcoin::ec_secret& secret) const;
};

// Keccak-256 of the signed RLP, the hash the network reports for the transaction
std::string GetTransactionHash(const ByteBuffer& rawSigned);

} // namespace warden::ethereum
