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

#include "password.h"
#include "envelope.h"
#include <openssl/evp.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace warden::crypto
{
    namespace
    {
        const char* kWeakPasswords[] =
        {
            "password", "123456", "12345678", "qwerty", "abc123",
            "password123", "admin", "letmein", "welcome", "monkey"
        };

        SecureBuffer Pbkdf2(const std::string& password, const ByteBuffer& salt, uint32_t iterations)
        {
            if (password.size() > static_cast<size_t>(std::numeric_limits<int>::max())
                || iterations > static_cast<uint32_t>(std::numeric_limits<int>::max()))
            {
                throw CryptoException();
            }

            SecureBuffer out(PasswordVerifier::kHashSize);
            int ret = PKCS5_PBKDF2_HMAC(
                password.data(), static_cast<int>(password.size()),
                salt.data(), static_cast<int>(salt.size()),
                static_cast<int>(iterations),
                EVP_sha256(),
                static_cast<int>(out.size()), out.data());
            if (ret != 1)
                throw CryptoException();
            return out;
        }
    }

    boost::optional<std::string> PasswordPolicy::validate(const std::string& password) const
    {
        if (password.size() < m_minLength)
            return std::string("password must be at least ") + std::to_string(m_minLength) + " characters long";

        auto has = [&password](int (*pred)(int))
        {
            return std::any_of(password.begin(), password.end(), [pred](char c) { return pred(static_cast<unsigned char>(c)) != 0; });
        };

        if (m_requireUpper && !has(::isupper))
            return std::string("password must contain an uppercase letter");
        if (m_requireLower && !has(::islower))
            return std::string("password must contain a lowercase letter");
        if (m_requireDigit && !has(::isdigit))
            return std::string("password must contain a digit");
        if (m_requireSpecial && !has(::ispunct))
            return std::string("password must contain a special character");

        const std::string lowered = boost::algorithm::to_lower_copy(password);
        for (const char* weak : kWeakPasswords)
        {
            if (lowered == weak)
                return std::string("password is too common");
        }
        return boost::none;
    }

    PasswordVerifier PasswordVerifier::create(const std::string& password, uint32_t iterations)
    {
        PasswordVerifier verifier;
        verifier.m_iterations = iterations;
        verifier.m_salt.resize(kSaltSize);
        GenerateRandom(verifier.m_salt.data(), verifier.m_salt.size());

        SecureBuffer hash = Pbkdf2(password, verifier.m_salt, iterations);
        verifier.m_hash.assign(hash.data(), hash.data() + hash.size());
        return verifier;
    }

    bool PasswordVerifier::check(const std::string& password) const
    {
        if (!isInitialized())
            return false;

        SecureBuffer hash = Pbkdf2(password, m_salt, m_iterations);
        return memeq_ct(hash.data(), m_hash.data(), kHashSize);
    }
}
