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
#include "utility/common.h"
#include <boost/optional.hpp>
#include <string>

namespace warden::crypto
{
    struct PasswordPolicy
    {
        size_t m_minLength = 8;
        bool m_requireUpper = true;
        bool m_requireLower = true;
        bool m_requireDigit = true;
        bool m_requireSpecial = false;

        /// Returns the first violated rule, none if the password is acceptable
        boost::optional<std::string> validate(const std::string& password) const;
    };

    /// PBKDF2-HMAC-SHA256 verifier. Only gates access, never used as an encryption key.
    struct PasswordVerifier
    {
        static constexpr size_t kSaltSize = 16;
        static constexpr size_t kHashSize = 32;
        static constexpr uint32_t kDefaultIterations = 100000;

        ByteBuffer m_salt;
        uint32_t m_iterations = kDefaultIterations;
        ByteBuffer m_hash;

        static PasswordVerifier create(const std::string& password, uint32_t iterations = kDefaultIterations);

        bool check(const std::string& password) const;
        bool isInitialized() const { return m_salt.size() == kSaltSize && m_hash.size() == kHashSize && m_iterations > 0; }
    };
}
