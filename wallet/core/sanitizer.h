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

#include <string>

namespace warden::wallet
{
    // Redacts private keys, mnemonics, credentials, e-mails, IP addresses,
    // file system paths and database connection strings
    std::string SanitizeMessage(const std::string& message);

    // Shorter form used for log lines, keeps a hint of what was removed
    std::string SanitizeForLog(const std::string& message);
} // namespace warden::wallet
