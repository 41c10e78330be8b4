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

#include <boost/program_options.hpp>
#include <string>
#include <vector>
#include "logger.h"

namespace warden
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* CONFIG_FILE;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_PATH;
        extern const char* STORAGE;
        extern const char* KEK_ID;
        extern const char* KEK_ENV;
        extern const char* TEST_MODE;
        extern const char* COMMAND;
        extern const char* WALLET_NAME;
        extern const char* PASS;
        extern const char* NETWORK;
        extern const char* RECEIVER_ADDR;
        extern const char* RECEIVER_ADDR_FULL;
        extern const char* AMOUNT;
        extern const char* AMOUNT_FULL;
        extern const char* MNEMONIC;
        extern const char* QUANTUM_SAFE;
        extern const char* SIGNATURES;
        extern const char* THRESHOLD;
        extern const char* TIMEOUT_MS;

        // commands
        extern const char* CREATE;
        extern const char* RESTORE;
        extern const char* DELETE;
        extern const char* LIST;
        extern const char* ADDRESS;
        extern const char* BALANCE;
        extern const char* SEND;
        extern const char* SEND_MULTISIG;
        extern const char* ROTATE;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS = 1 << 0,
        WALLET_OPTIONS  = 1 << 1,

        ALL_OPTIONS     = GENERAL_OPTIONS | WALLET_OPTIONS
    };

    po::options_description createOptionsDescription(int flags = ALL_OPTIONS);

    // command line values take precedence over the ones from configFile (ini syntax)
    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options);

    int getLogLevel(const std::string& dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_DEBUG);

    // splits comma separated multitoken values, e.g. --signatures a,b --signatures c
    std::vector<std::string> getListOption(const po::variables_map& vm, const char* name);
}
