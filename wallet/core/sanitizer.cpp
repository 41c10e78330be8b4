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

#include "sanitizer.h"

#include <regex>
#include <utility>
#include <vector>

namespace warden::wallet
{
    namespace
    {
        using Rule = std::pair<std::regex, const char*>;
        using Rules = std::vector<Rule>;

        const auto icase = std::regex::ECMAScript | std::regex::icase;

        const Rules& GetMessageRules()
        {
            static const Rules rules =
            {
                { std::regex(R"(0x[0-9a-fA-F]{64})"), "[REDACTED_PRIVATE_KEY]" },
                { std::regex(R"(\b([a-z]{3,8}\s+){11,23}[a-z]{3,8}\b)"), "[REDACTED_MNEMONIC]" },
                { std::regex(R"(api[_-]?key['"]?\s*[:=]\s*['"]?[a-zA-Z0-9_-]{8,})", icase), "api_key=[REDACTED]" },
                { std::regex(R"(secret['"]?\s*[:=]\s*['"]?[^\s'"]{6,})", icase), "secret=[REDACTED]" },
                { std::regex(R"(token['"]?\s*[:=]\s*['"]?[^\s'"]{6,})", icase), "token=[REDACTED]" },
                { std::regex(R"(eyJ[a-zA-Z0-9_-]*\.eyJ[a-zA-Z0-9_-]*\.[a-zA-Z0-9_-]*)"), "[REDACTED_JWT]" },
                { std::regex(R"(password['"]?\s*[:=]\s*['"]?[^\s'"]{1,})", icase), "password=[REDACTED]" },
                { std::regex(R"((postgres|postgresql|mysql|mongodb|sqlite)://[^\s]+)", icase), "[REDACTED_DB_URL]" },
                { std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"), "[REDACTED_EMAIL]" },
                { std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)"), "xxx.xxx.xxx.xxx" },
                { std::regex(R"([a-z]:\\[^\s]+|/home/[^\s]+|/root/[^\s]+|/Users/[^\s]+)", icase), "[REDACTED_PATH]" }
            };
            return rules;
        }

        const Rules& GetLogRules()
        {
            static const Rules rules =
            {
                { std::regex(R"(0x[0-9a-fA-F]{64})"), "0x[REDACTED_64_CHARS]" },
                { std::regex(R"(\b([a-z]{3,8}\s+){11,23}[a-z]{3,8}\b)"), "[MNEMONIC_PHRASE]" },
                { std::regex(R"(eyJ[a-zA-Z0-9_-]*\.eyJ[a-zA-Z0-9_-]*\.[a-zA-Z0-9_-]*)"), "eyJ...[JWT]" },
                { std::regex(R"(password['"]?\s*[:=]\s*['"]?[^\s'"]{1,})", icase), "password=[REDACTED]" },
                { std::regex(R"((postgres|postgresql|mysql|mongodb|sqlite)://[^\s]+)", icase), "[REDACTED_DB_URL]" }
            };
            return rules;
        }

        std::string Apply(const Rules& rules, const std::string& message)
        {
            std::string sanitized = message;
            for (const auto& rule : rules)
            {
                sanitized = std::regex_replace(sanitized, rule.first, rule.second);
            }
            return sanitized;
        }
    }

    std::string SanitizeMessage(const std::string& message)
    {
        return Apply(GetMessageRules(), message);
    }

    std::string SanitizeForLog(const std::string& message)
    {
        return Apply(GetLogRules(), message);
    }
} // namespace warden::wallet
