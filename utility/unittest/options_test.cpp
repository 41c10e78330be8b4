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

#include "utility/options.h"

#include <iostream>
#include <string>
#include <vector>

using namespace warden;
using namespace std;

static int error_count = 0;

#define CHECK(s) \
do {\
    if (!(s)) {\
        cout << "\"" << #s << "\" failed at line " << __LINE__ << '\n';\
        ++error_count;\
    }\
} while(false)\

namespace
{
    po::variables_map Parse(vector<string> args)
    {
        vector<char*> argv;
        for (auto& arg : args)
        {
            argv.push_back(&arg[0]);
        }
        return getOptions(static_cast<int>(argv.size()), argv.data(), "warden-options-test-missing.cfg", createOptionsDescription());
    }
}

void CommandLineTest()
{
    auto vm = Parse({ "warden-cli", "send", "--wallet", "w1", "--password", "Str0ng!Pass", "-t", "0xabc", "-a", "1.5" });
    CHECK(vm[cli::COMMAND].as<string>() == "send");
    CHECK(vm[cli::WALLET_NAME].as<string>() == "w1");
    CHECK(vm.count("password") == 1);
    CHECK(vm[cli::PASS].as<string>() == "Str0ng!Pass");
    CHECK(vm[cli::RECEIVER_ADDR].as<string>() == "0xabc");
    CHECK(vm[cli::AMOUNT].as<string>() == "1.5");
    CHECK(vm[cli::NETWORK].as<string>() == "eth");
    CHECK(vm[cli::THRESHOLD].as<uint32_t>() == 1);
    CHECK(!vm[cli::TEST_MODE].as<bool>());
}

void ListOptionTest()
{
    auto vm = Parse({ "warden-cli", "send_multisig", "--signatures", "aa, bb", "cc", "--threshold", "3" });
    auto signatures = getListOption(vm, cli::SIGNATURES);
    CHECK(signatures.size() == 3);
    CHECK(signatures[0] == "aa" && signatures[1] == "bb" && signatures[2] == "cc");
    CHECK(vm[cli::THRESHOLD].as<uint32_t>() == 3);
    CHECK(getListOption(vm, cli::MNEMONIC).empty());
}

void LogLevelTest()
{
    auto vm = Parse({ "warden-cli", "list", "--log_level", "warning" });
    CHECK(getLogLevel(cli::LOG_LEVEL, vm) == LOG_LEVEL_WARNING);
    CHECK(getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_LEVEL_INFO) == LOG_LEVEL_INFO);
}

int main()
{
    CommandLineTest();
    ListOptionTest();
    LogLevelTest();

    return error_count;
}
