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

#include "utility/config.h"
#include "utility/logger.h"
#include "utility/options.h"
#include "wallet/core/sanitizer.h"
#include "wallet/core/wallet_db.h"
#include "wallet/core/wallet_service.h"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "0.0.0"
#endif

#define APP_NAME "warden-cli"
#define LOG_FILES_PREFIX "warden_"

using namespace std;
using namespace warden;
using namespace warden::wallet;

namespace
{
    const char kDefaultConfigFile[] = APP_NAME ".cfg";

    const char kErrorCommandNotSpecified[] = "command parameter not specified.";
    const char kErrorCommandUnknown[] = "unknown command: \'%1%\'";
    const char kErrorMissingParameter[] = "parameter \'%1%\' is required for this command";
    const char kErrorOperation[] = "%1%: %2%";

    struct CliContext
    {
        boost::asio::io_context m_ioc;
        crypto::KekRing m_keks;
        std::unique_ptr<WalletService> m_service;
    };

    using CommandFunc = int (*)(const po::variables_map&, CliContext&);
    struct Command
    {
        std::string name;
        CommandFunc handler;
        std::string description;
    };

    void printHelp(const Command* begin, const Command* end, const po::options_description& options)
    {
        cout << "\nUSAGE: " << APP_NAME << " <command> [options]\n\n";
        cout << "COMMANDS:\n";
        for (auto it = begin; it != end; ++it)
        {
            cout << "  " << std::left << std::setw(20) << it->name << it->description << '\n';
        }
        cout << std::endl << options << std::endl;
    }

    std::string getRequired(const po::variables_map& vm, const char* name)
    {
        if (!vm.count(name) || vm[name].as<string>().empty())
        {
            throw po::error((boost::format(kErrorMissingParameter) % name).str());
        }
        return vm[name].as<string>();
    }

    int reportError(const Error& error)
    {
        LOG_ERROR() << boost::format(kErrorOperation) % GetErrorCodeName(error.m_type) % error.m_message;
        return -1;
    }

    int CreateWallet(const po::variables_map& vm, CliContext& ctx)
    {
        auto words = ctx.m_service->createWallet(getRequired(vm, cli::WALLET_NAME), getRequired(vm, cli::PASS), vm[cli::QUANTUM_SAFE].as<bool>());

        cout << "Wallet created. Write the recovery phrase down, it is shown only once:\n";
        for (size_t i = 0; i < words.size(); ++i)
        {
            cout << words[i] << (i + 1 == words.size() ? '\n' : ' ');
        }
        return 0;
    }

    int RestoreWallet(const po::variables_map& vm, CliContext& ctx)
    {
        ctx.m_service->restoreWallet(getRequired(vm, cli::WALLET_NAME), getRequired(vm, cli::MNEMONIC), getRequired(vm, cli::PASS), vm[cli::QUANTUM_SAFE].as<bool>());
        cout << "Wallet restored" << endl;
        return 0;
    }

    int DeleteWallet(const po::variables_map& vm, CliContext& ctx)
    {
        ctx.m_service->deleteWallet(getRequired(vm, cli::WALLET_NAME));
        cout << "Wallet deleted" << endl;
        return 0;
    }

    int ListWallets(const po::variables_map&, CliContext& ctx)
    {
        const auto wallets = ctx.m_service->listWallets();
        cout << boost::format("%1% wallet(s)") % wallets.size() << endl;
        for (const auto& w : wallets)
        {
            cout << boost::format("  %1% id: %2% created: %3% schema: v%4% kek: %5%%6%")
                % w.m_name % w.m_id % w.m_createdAt % w.m_schemaVersion % w.m_kekId % (w.m_quantumSafe ? " quantum-safe" : "")
                << endl;
        }
        return 0;
    }

    int GetAddress(const po::variables_map& vm, CliContext& ctx)
    {
        cout << ctx.m_service->getAddress(getRequired(vm, cli::WALLET_NAME), vm[cli::NETWORK].as<string>(), getRequired(vm, cli::PASS)) << endl;
        return 0;
    }

    int GetBalance(const po::variables_map& vm, CliContext& ctx)
    {
        int result = 0;
        ctx.m_service->getBalance(getRequired(vm, cli::WALLET_NAME), vm[cli::NETWORK].as<string>(), getRequired(vm, cli::PASS),
            [&result](const Error& error, const Balance& balance)
            {
                if (!error.isOk())
                {
                    result = reportError(error);
                    return;
                }
                cout << balance.m_formatted << endl;
            });
        ctx.m_ioc.run();
        return result;
    }

    int Send(const po::variables_map& vm, CliContext& ctx)
    {
        int result = 0;
        ctx.m_service->sendTransaction(getRequired(vm, cli::WALLET_NAME),
                                       getRequired(vm, cli::RECEIVER_ADDR),
                                       getRequired(vm, cli::AMOUNT),
                                       vm[cli::NETWORK].as<string>(),
                                       getRequired(vm, cli::PASS),
            [&result](const Error& error, const SendResult& sent)
            {
                if (!error.isOk())
                {
                    result = reportError(error);
                    return;
                }
                cout << sent.m_txHash << endl;
            });
        ctx.m_ioc.run();
        return result;
    }

    int SendMultisig(const po::variables_map& vm, CliContext& ctx)
    {
        auto txId = ctx.m_service->sendMultiSig(getRequired(vm, cli::WALLET_NAME),
                                                vm[cli::NETWORK].as<string>(),
                                                getRequired(vm, cli::RECEIVER_ADDR),
                                                getRequired(vm, cli::AMOUNT),
                                                getListOption(vm, cli::SIGNATURES),
                                                vm[cli::THRESHOLD].as<uint32_t>());
        cout << txId << endl;
        return 0;
    }

    int RotateKey(const po::variables_map& vm, CliContext& ctx)
    {
        auto rotation = ctx.m_service->rotateSigningKey(getRequired(vm, cli::WALLET_NAME));
        cout << boost::format("key version %1% -> %2%") % rotation.m_oldVersion % rotation.m_newVersion << endl;
        return 0;
    }

    Config loadConfig(const po::variables_map& vm)
    {
        Config config;
        const auto configFile = vm[cli::CONFIG_FILE].as<string>();
        if (boost::filesystem::exists(configFile))
        {
            config.load(configFile);
        }
        if (vm.count(cli::KEK_ID))
        {
            config.set("kek.id", vm[cli::KEK_ID].as<string>());
        }
        if (vm.count(cli::KEK_ENV))
        {
            config.set("kek.env", vm[cli::KEK_ENV].as<string>());
        }
        if (vm[cli::TEST_MODE].as<bool>())
        {
            config.set("test_mode", true);
        }
        if (vm.count(cli::TIMEOUT_MS))
        {
            config.set("network.timeout_ms", Config::Int(vm[cli::TIMEOUT_MS].as<uint32_t>()));
        }
        return config;
    }

    void openService(const po::variables_map& vm, CliContext& ctx)
    {
        const auto settings = ServiceSettings::fromConfig(config());
        ctx.m_keks.add(crypto::RootKek::fromEnvironment(settings.m_kekEnv, settings.m_kekId, settings.m_testMode));

        const auto storagePath = vm[cli::STORAGE].as<string>();
        IWalletStorage::Ptr storage;
        if (storagePath.empty())
        {
            LOG_WARNING() << "No storage path, wallets are kept in memory only";
            storage = std::make_shared<MemoryWalletStorage>();
        }
        else
        {
            storage = SqliteWalletStorage::open(storagePath);
        }

        ctx.m_service = std::make_unique<WalletService>(ctx.m_ioc, storage, ctx.m_keks, settings);
    }
}

int main(int argc, char* argv[])
{
    const Command commands[] =
    {
        {cli::CREATE,          CreateWallet,   "create a new wallet and print its recovery phrase once"},
        {cli::RESTORE,         RestoreWallet,  "restore a wallet from a recovery phrase"},
        {cli::DELETE,          DeleteWallet,   "delete a wallet and its sequencing state"},
        {cli::LIST,            ListWallets,    "print wallets without secrets"},
        {cli::ADDRESS,         GetAddress,     "print the address of a wallet on a network"},
        {cli::BALANCE,         GetBalance,     "print the balance of a wallet on a network"},
        {cli::SEND,            Send,           "sign and broadcast a native transfer"},
        {cli::SEND_MULTISIG,   SendMultisig,   "assemble a transfer from external signatures"},
        {cli::ROTATE,          RotateKey,      "rotate the signing key version and re-encrypt the master key"},
    };

    try
    {
        auto options = createOptionsDescription(GENERAL_OPTIONS | WALLET_OPTIONS);

        po::variables_map vm;
        try
        {
            vm = getOptions(argc, argv, kDefaultConfigFile, options);
        }
        catch (const po::error& e)
        {
            cout << e.what() << std::endl;
            printHelp(begin(commands), end(commands), options);
            return 0;
        }

        if (vm.count(cli::HELP))
        {
            printHelp(begin(commands), end(commands), options);
            return 0;
        }

        if (vm.count(cli::VERSION))
        {
            cout << WARDEN_VERSION << endl;
            return 0;
        }

        int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO);
        int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);

        const auto path = boost::filesystem::system_complete(vm[cli::LOG_PATH].as<string>());
        auto logger = Logger::create(logLevel, logLevel, fileLogLevel, LOG_FILES_PREFIX, path.string());

        try
        {
            if (vm.count(cli::COMMAND) == 0)
            {
                LOG_ERROR() << kErrorCommandNotSpecified;
                printHelp(begin(commands), end(commands), options);
                return 0;
            }

            auto command = vm[cli::COMMAND].as<string>();

            auto cit = find_if(begin(commands), end(commands), [&command](const auto& p) { return p.name == command; });
            if (cit == end(commands))
            {
                LOG_ERROR() << boost::format(kErrorCommandUnknown) % SanitizeForLog(command);
                return -1;
            }

            reset_global_config(loadConfig(vm));

            CliContext ctx;
            openService(vm, ctx);

            LOG_DEBUG() << APP_NAME << " " << WARDEN_VERSION;
            return cit->handler(vm, ctx);
        }
        catch (const WalletException& ex)
        {
            return reportError(MakeError(ex));
        }
        catch (const FileIsNotDatabaseException&)
        {
            LOG_ERROR() << "storage file is not a database";
            return -1;
        }
        catch (const DatabaseException& ex)
        {
            LOG_ERROR() << SanitizeForLog(ex.what());
            return -1;
        }
        catch (const po::error& e)
        {
            LOG_ERROR() << e.what();
            printHelp(begin(commands), end(commands), options);
            return -1;
        }
        catch (const std::runtime_error& e)
        {
            LOG_ERROR() << SanitizeForLog(e.what());
            return -1;
        }
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    return 0;
}
