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

#include "hex.h"
#include <stdexcept>

namespace warden
{
    namespace
    {
        template<typename It>
        void to_hex_impl(It dst, const void* bytes, size_t size)
        {
            static const char digits[] = "0123456789abcdef";

            const uint8_t* ptr = (const uint8_t*)bytes;
            const uint8_t* end = ptr + size;
            while (ptr < end) {
                uint8_t c = *ptr++;
                *dst++ = digits[c >> 4];
                *dst++ = digits[c & 0xF];
            }
        }

        int hex_digit(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            return -1;
        }
    }

    char* to_hex(char* dst, const void* bytes, size_t size)
    {
        to_hex_impl(dst, bytes, size);
        *(dst + size * 2) = '\0';
        return dst;
    }

    std::string to_hex(const void* bytes, size_t size)
    {
        std::string res;
        res.resize(size * 2);
        to_hex_impl(res.begin(), bytes, size);
        return res;
    }

    std::vector<uint8_t> from_hex(std::string_view str, bool* wholeStringIsNumber)
    {
        size_t bias = (str.size() % 2) == 0 ? 0 : 1;
        std::vector<uint8_t> res((str.size() + bias) >> 1);

        if (wholeStringIsNumber) *wholeStringIsNumber = true;

        for (size_t i = 0; i < str.size(); ++i)
        {
            int d = hex_digit(str[i]);
            if (d < 0)
            {
                if (wholeStringIsNumber) *wholeStringIsNumber = false;
                break;
            }
            size_t j = (i + bias) >> 1;
            res[j] = static_cast<uint8_t>((res[j] << 4) + d);
        }

        return res;
    }

    std::vector<uint8_t> from_hex_strict(std::string_view str)
    {
        if (str.size() % 2 != 0)
            throw std::invalid_argument("odd hex length");

        bool isValid = false;
        auto res = from_hex(str, &isValid);
        if (!isValid)
            throw std::invalid_argument("invalid hex character");
        return res;
    }

} //namespace
