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

#include "secure_buffer.h"
#include "envelope.h"
#include "utility/common.h"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <limits>

namespace warden::crypto
{
    void SecureErase(void* p, size_t n)
    {
        if (p && n)
            OPENSSL_cleanse(p, n);
    }

    void GenerateRandom(void* p, size_t n)
    {
        if (n > static_cast<size_t>(std::numeric_limits<int>::max()))
            throw CryptoException();
        if (RAND_bytes(static_cast<unsigned char*>(p), static_cast<int>(n)) != 1)
            throw CryptoException();
    }

    SecureBuffer::SecureBuffer(size_t size)
        : m_data(size ? new uint8_t[size]() : nullptr)
        , m_size(size)
    {
    }

    SecureBuffer::SecureBuffer(const void* p, size_t size)
    {
        assign(p, size);
    }

    SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
        : m_data(std::move(other.m_data))
        , m_size(other.m_size)
    {
        other.m_size = 0;
    }

    SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept
    {
        if (this != &other)
        {
            erase();
            m_data = std::move(other.m_data);
            m_size = other.m_size;
            other.m_size = 0;
        }
        return *this;
    }

    SecureBuffer::~SecureBuffer()
    {
        erase();
    }

    SecureBuffer SecureBuffer::random(size_t size)
    {
        SecureBuffer res(size);
        GenerateRandom(res.data(), size);
        return res;
    }

    void SecureBuffer::assign(const void* p, size_t size)
    {
        erase();
        if (size > 0)
        {
            m_data.reset(new uint8_t[size]);
            memcpy(m_data.get(), p, size);
            m_size = size;
        }
    }

    void SecureBuffer::erase() noexcept
    {
        if (m_data)
        {
            SecureErase(m_data.get(), m_size);
            m_data.reset();
        }
        m_size = 0;
    }

    SecureBuffer SecureBuffer::clone() const
    {
        return SecureBuffer(data(), size());
    }

    bool SecureBuffer::isZero() const
    {
        uint8_t acc = 0;
        for (size_t i = 0; i < m_size; ++i)
            acc |= m_data[i];
        return acc == 0;
    }

    bool SecureBuffer::operator==(const SecureBuffer& other) const
    {
        if (m_size != other.m_size)
            return false;
        return memeq_ct(data(), other.data(), m_size);
    }
}
