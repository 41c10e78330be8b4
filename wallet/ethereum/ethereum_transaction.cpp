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

#include "ethereum_transaction.h"

#include <limits>

namespace
{
    using warden::ByteBuffer;
    using warden::ethereum::uint256;

    template <class T>
    uint8_t BytesRequired(T value)
    {
        static_assert(!std::numeric_limits<T>::is_signed, "only unsigned types supported");
        uint8_t i = 0;
        for (; value != 0; ++i, value >>= 8)
        {
        }
        return i;
    }

    class RLPStream
    {
    public:
        // Append given datum to the byte stream.
        RLPStream& append(uint64_t value) { return append(uint256(value)); }
        RLPStream& append(const uint256& value);
        RLPStream& append(const ByteBuffer& value);
        RLPStream& append(const libbitcoin::short_hash& value);

        // Shift operators for appending data items.
        template <class T> RLPStream& operator<<(const T& _data) { return append(_data); }

        // return finallized list(compute and add full size of list before data) 
        ByteBuffer out() const;

    private:
        static const uint8_t kRLPDataLenStart = 0x80;

        ByteBuffer EncodeLength(size_t size, uint8_t offset = kRLPDataLenStart) const;

        ByteBuffer m_out;
    };

    RLPStream& RLPStream::append(const uint256& value)
    {
        // integers are encoded as big-endian byte strings without leading zeros
        return append(warden::ethereum::ConvertUint256ToBytes(value));
    }

    RLPStream& RLPStream::append(const ByteBuffer& value)
    {
        auto valueSize = value.size();
        if (value.empty())
        {
            m_out.push_back(0x80);
        }
        // For a single byte whose value is in the [0x00, 0x7f] range, that byte is its own RLP encoding
        else if (valueSize == 1 && value.front() < 0x80)
        {
            m_out.push_back(value.front());
        }
        else
        {
            auto lengthBuffer = EncodeLength(valueSize);
            m_out.reserve(m_out.size() + lengthBuffer.size() + valueSize);
            m_out.insert(m_out.end(), lengthBuffer.cbegin(), lengthBuffer.cend());
            m_out.insert(m_out.end(), value.begin(), value.end());
        }
        return *this;
    }

    RLPStream& RLPStream::append(const libbitcoin::short_hash& value)
    {
        auto valueSize = value.size();

        m_out.reserve(m_out.size() + valueSize + 1);
        m_out.push_back(static_cast<uint8_t>(kRLPDataLenStart + valueSize));
        m_out.insert(m_out.end(), value.begin(), value.end());
        return *this;
    }

    ByteBuffer RLPStream::out() const
    {
        constexpr uint8_t kRLPListOffset = 0xc0;
        auto outSize = m_out.size();
        auto lengthBuffer = EncodeLength(outSize, kRLPListOffset);

        ByteBuffer out;
        out.reserve(outSize + lengthBuffer.size());
        out.insert(out.end(), lengthBuffer.cbegin(), lengthBuffer.cend());
        out.insert(out.end(), m_out.cbegin(), m_out.cend());

        return out;
    }

    ByteBuffer RLPStream::EncodeLength(size_t size, uint8_t offset) const
    {
        constexpr uint8_t kRLPSmallDataLengthLimit = 55;

        if (size > kRLPSmallDataLengthLimit)
        {
            auto bytesRequired = BytesRequired(size);
            ByteBuffer out(bytesRequired + 1);
            // The range of the first byte is thus [0xb8, 0xbf] or [0xf8, 0xff] for list.
            out.front() = static_cast<uint8_t>(bytesRequired + offset + kRLPSmallDataLengthLimit);

            auto b = out.end();
            for (; size; size >>= 8)
            {
                *(--b) = static_cast<uint8_t>(size & 0xff);
            }

            return out;
        }

        // The range of the first byte is thus [0x80, 0xb7] or [0xc0, 0xf7] for list.
        return ByteBuffer{ static_cast<uint8_t>(size + offset) };
    }
} // namespace

namespace warden::ethereum
{
    ByteBuffer EthBaseTransaction::GetSigningPayload() const
    {
        RLPStream rlpStream;
        rlpStream << m_nonce << m_gasPrice << m_gas << m_receiveAddress << m_value << m_data;
        rlpStream << m_chainId << uint64_t(0) << uint64_t(0);
        return rlpStream.out();
    }

    libbitcoin::hash_digest EthBaseTransaction::GetSigningHash() const
    {
        auto txData = GetSigningPayload();
        return Keccak256(txData.data(), txData.size());
    }

    ByteBuffer EthBaseTransaction::GetRawSigned(const libbitcoin::ec_secret& secret) const
    {
        // Sign
        libbitcoin::recoverable_signature signature;
        if (!Sign(signature, secret))
        {
            // failed to sign raw TX
            return {};
        }

        RLPStream rlpStream;
        rlpStream << m_nonce << m_gasPrice << m_gas << m_receiveAddress << m_value << m_data;

        // v = chainId * 2 + 35 + recovery id
        uint256 v = uint256(m_chainId) * 2 + 35 + signature.recovery_id;
        rlpStream << v;
        // r
        rlpStream << ConvertBytesToUint256(signature.signature.data(), 32);
        // s
        rlpStream << ConvertBytesToUint256(signature.signature.data() + 32, 32);

        return rlpStream.out();
    }

    bool EthBaseTransaction::Sign(libbitcoin::recoverable_signature& out, const libbitcoin::ec_secret& secret) const
    {
        return libbitcoin::sign_recoverable(out, secret, GetSigningHash());
    }

    std::string GetTransactionHash(const ByteBuffer& rawSigned)
    {
        auto hash = Keccak256(rawSigned.data(), rawSigned.size());
        return AddHexPrefix(libbitcoin::encode_base16(hash));
    }
} // namespace warden::ethereum
