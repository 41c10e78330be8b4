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

#include "options.h"
#include <boost/algorithm/string.hpp>
#include <fstream>

using namespace std;

namespace warden
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* CONFIG_FILE = "config";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_PATH = "log_path";
        const char* STORAGE = "storage";
        const char* KEK_ID = "kek_id";
        const char* KEK_ENV = "kek_env";
        const char* TEST_MODE = "test_mode";
        const char* COMMAND = "command";
        const char* WALLET_NAME = "wallet";
        const char* PASS = "password";
        const char* NETWORK = "network";
        const char* RECEIVER_ADDR = "to";
        const char* RECEIVER_ADDR_FULL = "to,t";
        const char* AMOUNT = "amount";
        const char* AMOUNT_FULL = "amount,a";
        const char* MNEMONIC = "mnemonic";
        const char* QUANTUM_SAFE = "quantum_safe";
        const char* SIGNATURES = "signatures";
        const char* THRESHOLD = "threshold";
        const char* TIMEOUT_MS = "timeout_ms";

        const char* CREATE = "create";
        const char* RESTORE = "restore";
        const char* DELETE = "delete";
        const char* LIST = "list";
        const char* ADDRESS = "address";
        const char* BALANCE = "balance";
        const char* SEND = "send";
        const char* SEND_MULTISIG = "send_multisig";
        const char* ROTATE = "rotate";
    }

    po::options_description createOptionsDescription(int flags)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::VERSION_FULL, "return project version")
            (cli::CONFIG_FILE, po::value<string>()->default_value("warden.json"), "path to json config file")
            (cli::LOG_LEVEL, po::value<string>(), "log level [critical|error|warning|info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [critical|error|warning|info|debug|verbose|off]")
            (cli::LOG_PATH, po::value<string>()->default_value("logs"), "directory for log files");

        po::options_description wallet_options("Wallet options");
        wallet_options.add_options()
            (cli::STORAGE, po::value<string>()->default_value("warden.db"), "path to sqlite storage, empty for in-memory storage")
            (cli::KEK_ID, po::value<string>(), "identifier of the root key-encryption key")
            (cli::KEK_ENV, po::value<string>(), "environment variable holding the root key-encryption key")
            (cli::TEST_MODE, po::bool_switch(), "allow the all-zero root key (tests only)")
            (cli::WALLET_NAME, po::value<string>(), "wallet name")
            (cli::PASS, po::value<string>(), "wallet password")
            (cli::NETWORK, po::value<string>()->default_value("eth"), "network tag [eth|ethereum|sepolia|polygon|bsc|bitcoin|btc]")
            (cli::RECEIVER_ADDR_FULL, po::value<string>(), "address of receiver")
            (cli::AMOUNT_FULL, po::value<string>(), "amount to send as a decimal string in coins")
            (cli::MNEMONIC, po::value<string>(), "space separated BIP-39 recovery phrase")
            (cli::QUANTUM_SAFE, po::bool_switch(), "use the alternative AEAD for the master key")
            (cli::SIGNATURES, po::value<vector<string>>()->multitoken(), "external signatures for multisig send")
            (cli::THRESHOLD, po::value<uint32_t>()->default_value(1), "multisig threshold")
            (cli::TIMEOUT_MS, po::value<uint32_t>(), "network request timeout in milliseconds")
            (cli::COMMAND, po::value<string>(), "command to execute [create|restore|delete|list|address|balance|send|send_multisig|rotate]");

        po::options_description options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
        }
        if (flags & WALLET_OPTIONS)
        {
            options.add(wallet_options);
        }
        return options;
    }

    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        positional.add(cli::COMMAND, 1);

        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        {
            std::ifstream cfg(configFile);
            if (cfg)
            {
                po::store(po::parse_config_file(cfg, options, true), vm);
            }
        }

        po::notify(vm);
        return vm;
    }

    int getLogLevel(const std::string& dstLog, const po::variables_map& vm, int defaultValue)
    {
        if (vm.count(dstLog))
        {
            return parse_log_level(vm[dstLog].as<string>(), defaultValue);
        }
        return defaultValue;
    }

    std::vector<std::string> getListOption(const po::variables_map& vm, const char* name)
    {
        vector<string> result;
        if (vm.count(name))
        {
            for (const auto& value : vm[name].as<vector<string>>())
            {
                vector<string> parts;
                boost::algorithm::split(parts, value, boost::is_any_of(","));
                for (auto& p : parts)
                {
                    boost::algorithm::trim(p);
                    if (!p.empty())
                        result.push_back(p);
                }
            }
        }
        return result;
    }
}
