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
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace warden::crypto
{
    // Overwrites memory in a way the compiler may not elide
    void SecureErase(void* p, size_t n);
    template <typename T> void SecureErase(T& t) { SecureErase(&t, sizeof(T)); }

    template <typename T>
    struct NoLeak
    {
        T V;
        ~NoLeak() { SecureErase(V); }
    };

    /// Heap buffer for key material. Contents are wiped on release and on every reassignment.
    /// Not copyable, a moved-from buffer is empty.
    class SecureBuffer
    {
    public:
        SecureBuffer() = default;
        explicit SecureBuffer(size_t size);
        SecureBuffer(const void* p, size_t size);
        SecureBuffer(const SecureBuffer&) = delete;
        SecureBuffer& operator=(const SecureBuffer&) = delete;
        SecureBuffer(SecureBuffer&& other) noexcept;
        SecureBuffer& operator=(SecureBuffer&& other) noexcept;
        ~SecureBuffer();

        // fills with bytes from the OS CSPRNG, throws CryptoException on failure
        static SecureBuffer random(size_t size);

        void assign(const void* p, size_t size);
        void erase() noexcept;

        SecureBuffer clone() const;

        uint8_t* data() { return m_data.get(); }
        const uint8_t* data() const { return m_data.get(); }
        size_t size() const { return m_size; }
        bool empty() const { return m_size == 0; }

        bool isZero() const;
        bool operator==(const SecureBuffer& other) const; // constant time for equal sizes
        bool operator!=(const SecureBuffer& other) const { return !(*this == other); }

    private:
        std::unique_ptr<uint8_t[]> m_data;
        size_t m_size = 0;
    };

    // Fills p with n random bytes or throws
    void GenerateRandom(void* p, size_t n);
}
