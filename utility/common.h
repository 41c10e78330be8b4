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

#include <assert.h>
#include <array>
#include <vector>
#include <map>
#include <string>
#include <utility>
#include <cstdint>
#include <memory>
#include <functional>
#include <string.h> // memcmp

#ifndef WARDEN_VERIFY
#	ifdef  NDEBUG
#		define WARDEN_VERIFY(x) ((void)(x))
#	else //  NDEBUG
#		define WARDEN_VERIFY(x) assert(x)
#	endif //  NDEBUG
#endif // verify

#ifndef _countof
#	define _countof(_Array) (sizeof(_Array) / sizeof(_Array[0]))
#endif // _countof

namespace warden
{
    typedef uint64_t Timestamp;
    typedef uint64_t Amount;
    typedef std::vector<Amount> AmountList;
    typedef std::vector<uint8_t> ByteBuffer;

    // Not constant-time. Must not be used to compare secret data
    bool memis0(const void* p, size_t n);

    // Constant-time comparison of equally sized buffers
    bool memeq_ct(const void* a, const void* b, size_t n);

    inline ByteBuffer to_byte_buffer(const std::string& s)
    {
        return ByteBuffer(s.begin(), s.end());
    }

    template <typename T>
    inline typename std::underlying_type<T>::type underlying_cast(T value)
    {
        return static_cast<typename std::underlying_type<T>::type>(value);
    }
}
