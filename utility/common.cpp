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

namespace warden
{
    bool memis0(const void* p, size_t n)
    {
        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(p);
        for (size_t i = 0; i < n; ++i)
            if (ptr[i])
                return false;
        return true;
    }

    bool memeq_ct(const void* a, const void* b, size_t n)
    {
        const volatile uint8_t* pa = reinterpret_cast<const volatile uint8_t*>(a);
        const volatile uint8_t* pb = reinterpret_cast<const volatile uint8_t*>(b);
        uint8_t diff = 0;
        for (size_t i = 0; i < n; ++i)
            diff |= pa[i] ^ pb[i];
        return diff == 0;
    }
}
