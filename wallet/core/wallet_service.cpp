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

#include "wallet_service.h"

#include "address.h"
#include "sanitizer.h"
#include "utility/helpers.h"
#include "utility/logger.h"
#include "wallet/bitcoin/bitcoin_signer.h"
#include "wallet/bitcoin/blockstream_bridge.h"
#include "wallet/ethereum/ethereum_bridge.h"
#include "wallet/ethereum/ethereum_signer.h"

#include <limits>
#include <regex>

namespace warden::wallet
{
    namespace
    {
        const size_t kMaxNameLength = 64;

        // wipes a plain byte vector when the scope ends
        struct ScopedWipe
        {
            explicit ScopedWipe(std::vector<uint8_t>& buffer) : m_buffer(buffer) {}
            ~ScopedWipe() { crypto::SecureErase(m_buffer.data(), m_buffer.size()); }
            std::vector<uint8_t>& m_buffer;
        };

        struct ScopedWordsWipe
        {
            explicit ScopedWordsWipe(WordList& words) : m_words(words) {}
            ~ScopedWordsWipe() { wipeMnemonic(m_words); }
            WordList& m_words;
        };

        crypto::SecureBuffer MasterKeyFromWords(const WordList& words)
        {
            auto seed = decodeMnemonic(words);
            ScopedWipe wipe(seed);
            if (seed.size() < crypto::kKeySize)
            {
                throw MnemonicException("seed is too short");
            }
            return crypto::SecureBuffer(seed.data(), crypto::kKeySize);
        }
    }

    WalletService::WalletService(boost::asio::io_context& ioc,
                                 IWalletStorage::Ptr storage,
                                 const crypto::KekRing& keks,
                                 const ServiceSettings& settings)
        : m_ioc(ioc)
        , m_settings(settings)
        , m_envelopeCrypto(keks)
        , m_store(storage)
        , m_nonceLedger(storage)
        , m_keyRegistry(storage)
        , m_multisig(settings.m_maxSigners)
    {
        if (keks.empty())
        {
            throw WalletException(ErrorCode::ValidationError, "no root key configured");
        }

        const unsigned timeout = m_settings.m_timeoutMsec;
        m_ethereumBridgeFactory = [this, timeout](const NetworkInfo&, const std::string& rpcUrl)
        {
            return std::make_shared<ethereum::EthereumBridge>(m_ioc, rpcUrl, timeout);
        };
        m_bitcoinBridgeFactory = [this, timeout](const std::string& indexerUrl)
        {
            return std::make_shared<bitcoin::BlockstreamBridge>(m_ioc, indexerUrl, timeout);
        };

        m_store.load();
        LOG_INFO() << "Wallet service started, " << m_store.size() << " wallet(s) loaded";
    }

    void WalletService::setEthereumBridgeFactory(EthereumBridgeFactory factory)
    {
        m_ethereumBridgeFactory = std::move(factory);
    }

    void WalletService::setBitcoinBridgeFactory(BitcoinBridgeFactory factory)
    {
        m_bitcoinBridgeFactory = std::move(factory);
    }

    void WalletService::setMultisigBroadcaster(MultisigBroadcaster broadcaster)
    {
        m_multisig = MultisigCoordinator(m_settings.m_maxSigners, std::move(broadcaster));
    }

    WordList WalletService::createWallet(const std::string& name, const std::string& password, bool quantumSafe)
    {
        validateName(name);
        validatePassword(password);
        if (m_store.contains(name))
        {
            throw WalletException(ErrorCode::AlreadyExists, "wallet already exists: " + name);
        }

        WordList words;
        crypto::SecureBuffer masterKey;
        try
        {
            auto entropy = getEntropy();
            ScopedWipe wipe(entropy);
            words = createMnemonic(entropy);
            masterKey = MasterKeyFromWords(words);
        }
        catch (const MnemonicException&)
        {
            throw WalletException(ErrorCode::CryptoError, "key generation failed");
        }

        addWallet(name, std::move(masterKey), password, quantumSafe);
        LOG_INFO() << "Wallet created: " << SanitizeForLog(name);
        return words;
    }

    void WalletService::restoreWallet(const std::string& name, const std::string& mnemonic, const std::string& password, bool quantumSafe)
    {
        validateName(name);
        validatePassword(password);

        auto words = parseMnemonic(mnemonic);
        ScopedWordsWipe wipeWords(words);
        if (!isAllowedWordCount(words.size()))
        {
            throw WalletException(ErrorCode::ValidationError, "mnemonic must have 12, 15, 18, 21 or 24 words");
        }
        if (!isValidMnemonic(words))
        {
            throw WalletException(ErrorCode::ValidationError, "invalid mnemonic");
        }
        if (m_store.contains(name))
        {
            throw WalletException(ErrorCode::AlreadyExists, "wallet already exists: " + name);
        }

        crypto::SecureBuffer masterKey;
        try
        {
            masterKey = MasterKeyFromWords(words);
        }
        catch (const MnemonicException&)
        {
            throw WalletException(ErrorCode::CryptoError, "key generation failed");
        }

        addWallet(name, std::move(masterKey), password, quantumSafe);
        LOG_INFO() << "Wallet restored: " << SanitizeForLog(name);
    }

    void WalletService::deleteWallet(const std::string& name)
    {
        // a wallet restored from the same words keeps its sequence counters
        m_store.remove(name, [this](const std::string& network, const std::string& address)
        {
            m_nonceLedger.purge(network, address);
        });
        m_keyRegistry.remove(GetWalletKeyLabel(name));

        LOG_INFO() << "Wallet deleted: " << SanitizeForLog(name);
    }

    std::vector<WalletSummary> WalletService::listWallets() const
    {
        return m_store.list();
    }

    std::string WalletService::getAddress(const std::string& name, const std::string& network, const std::string& password) const
    {
        auto info = GetNetwork(network);
        auto record = m_store.get(name);
        if (!record.supportsNetwork(info.m_tag))
        {
            throw WalletException(ErrorCode::ValidationError, "wallet does not support network " + info.m_tag);
        }

        auto masterKey = unlock(record, password);
        return DeriveAddress(masterKey, info.m_tag);
    }

    void WalletService::getBalance(const std::string& name, const std::string& network, const std::string& password, BalanceCallback callback)
    {
        NetworkInfo info;
        std::string address;
        try
        {
            info = GetNetwork(network);
            auto record = m_store.get(name);
            if (!record.supportsNetwork(info.m_tag))
            {
                throw WalletException(ErrorCode::ValidationError, "wallet does not support network " + info.m_tag);
            }
            address = getSourceAddress(record, info, password);
        }
        catch (const WalletException& ex)
        {
            callback(MakeError(ex), Balance());
            return;
        }

        if (info.m_type == NetworkType::Ethereum)
        {
            auto bridge = m_ethereumBridgeFactory(info, m_settings.getRpcUrl(info));
            bridge->getBalance(address, [callback, bridge](const ethereum::IBridge::Error& error, const ethereum::uint256& value)
            {
                Balance balance;
                if (error.m_type == ethereum::IBridge::None)
                {
                    balance.m_value = value;
                    balance.m_formatted = FormatAmount(value, ethereum::kEthDecimals);
                }
                callback(ethereum::ConvertBridgeError(error), balance);
            });
            return;
        }

        auto bridge = m_bitcoinBridgeFactory(m_settings.getRpcUrl(info));
        bridge->listUnspent(address, [callback, bridge](const bitcoin::IBridge::Error& error, const std::vector<bitcoin::Utxo>& utxos)
        {
            Balance balance;
            if (error.m_type == bitcoin::IBridge::None)
            {
                for (const auto& utxo : utxos)
                {
                    balance.m_value += utxo.m_value;
                }
                balance.m_formatted = FormatAmount(balance.m_value, bitcoin::kBtcDecimals);
            }
            callback(bitcoin::ConvertBridgeError(error), balance);
        });
    }

    void WalletService::sendTransaction(const std::string& name,
                                        const std::string& to,
                                        const std::string& amount,
                                        const std::string& network,
                                        const std::string& password,
                                        SendCallback callback)
    {
        NetworkInfo info;
        WalletRecord record;
        BaseUnits value;
        std::string from;
        try
        {
            // cheap checks first, nothing below touches the network
            info = GetNetwork(network);
            ValidateAddress(info, to);
            value = ParseAmount(amount, GetNetworkDecimals(info));
            if (info.m_type == NetworkType::Bitcoin && value > std::numeric_limits<Amount>::max())
            {
                throw WalletException(ErrorCode::ValidationError, "amount is too large");
            }

            record = m_store.get(name);
            if (!record.supportsNetwork(info.m_tag))
            {
                throw WalletException(ErrorCode::ValidationError, "wallet does not support network " + info.m_tag);
            }

            {
                // proves the envelope opens before a sequence is spent
                auto masterKey = unlock(record, password);
                auto it = record.m_addresses.find(info.m_tag);
                from = it != record.m_addresses.end() ? it->second : DeriveAddress(masterKey, info.m_tag);
            }
        }
        catch (const WalletException& ex)
        {
            callback(MakeError(ex), SendResult());
            return;
        }

        if (info.m_type == NetworkType::Ethereum)
        {
            sendEthereum(record, info, from, to, value, std::move(callback));
        }
        else
        {
            sendBitcoin(record, info, from, to, value, std::move(callback));
        }
    }

    void WalletService::sendEthereum(const WalletRecord& record, const NetworkInfo& network, const std::string& from,
                                     const std::string& to, const BaseUnits& value, SendCallback callback)
    {
        SendResult result;
        result.m_from = from;

        ethereum::TransferRequest request;
        try
        {
            request.m_from = from;
            request.m_to = ethereum::ConvertStrToEthAddress(to);
            request.m_value = value;
            request.m_chainId = network.m_chainId;

            result.m_sequence = m_nonceLedger.reserve(network.m_tag, from);
        }
        catch (const WalletException& ex)
        {
            callback(MakeError(ex), result);
            return;
        }
        catch (const std::invalid_argument&)
        {
            callback(MakeError(ErrorCode::ValidationError, "invalid ethereum address"), result);
            return;
        }

        auto signFunc = [this, record](const ethereum::EthBaseTransaction& tx)
        {
            auto masterKey = openEnvelope(record);
            crypto::NoLeak<libbitcoin::ec_secret> secret;
            ExtractSecret(masterKey, secret.V);
            auto signedTx = ethereum::SignTransaction(tx, secret.V);
            recordKeyUsage(record.m_name);
            return signedTx;
        };

        auto bridge = m_ethereumBridgeFactory(network, m_settings.getRpcUrl(network));
        ethereum::EthereumSender::send(bridge, request, signFunc,
            [this, record, network, result, callback](const Error& error, const std::string& txHash, uint64_t chainNonce)
            {
                auto sent = result;
                sent.m_txHash = txHash;
                sent.m_chainNonce = chainNonce;
                onSent(record, network, error, sent, callback);
            });
    }

    void WalletService::sendBitcoin(const WalletRecord& record, const NetworkInfo& network, const std::string& from,
                                    const std::string& to, const BaseUnits& value, SendCallback callback)
    {
        SendResult result;
        result.m_from = from;

        try
        {
            result.m_sequence = m_nonceLedger.reserve(network.m_tag, from);
        }
        catch (const WalletException& ex)
        {
            callback(MakeError(ex), result);
            return;
        }

        bitcoin::TransferRequest request;
        request.m_from = from;
        request.m_to = to;
        request.m_amount = value.convert_to<Amount>();
        request.m_feeRate = m_settings.m_feeRate;
        request.m_estimateFee = m_settings.m_feeSource == FeeSource::Indexer;
        request.m_feeTarget = m_settings.m_feeTarget;

        auto signFunc = [this, record](libbitcoin::chain::transaction& tx)
        {
            auto masterKey = openEnvelope(record);
            crypto::NoLeak<libbitcoin::ec_secret> secret;
            ExtractSecret(masterKey, secret.V);
            bitcoin::SignTransaction(tx, secret.V, bitcoin::getAddressVersion());
            recordKeyUsage(record.m_name);
        };

        auto bridge = m_bitcoinBridgeFactory(m_settings.getRpcUrl(network));
        bitcoin::BitcoinSender::send(bridge, request, signFunc,
            [this, record, network, result, callback](const Error& error, const std::string& txid, const bitcoin::CoinSelection& selection)
            {
                auto sent = result;
                sent.m_txHash = txid;
                sent.m_fee = selection.m_fee;
                onSent(record, network, error, sent, callback);
            });
    }

    void WalletService::onSent(const WalletRecord& record, const NetworkInfo& network, const Error& error, SendResult result, const SendCallback& callback)
    {
        if (!error.isOk())
        {
            // the reserved sequence stays skipped
            LOG_WARNING() << "Send from " << SanitizeForLog(record.m_name) << " on " << network.m_tag << " failed: " << error;
            callback(error, result);
            return;
        }

        try
        {
            m_nonceLedger.markUsed(network.m_tag, result.m_from, result.m_sequence);
        }
        catch (const WalletException& ex)
        {
            LOG_WARNING() << "Cannot mark sequence " << result.m_sequence << " used: " << ex.what();
        }

        LOG_INFO() << "Sent " << network.m_tag << " transaction " << result.m_txHash << " from " << result.m_from;
        callback(error, result);
    }

    std::string WalletService::sendMultiSig(const std::string& name,
                                            const std::string& network,
                                            const std::string& to,
                                            const std::string& amount,
                                            const std::vector<std::string>& signatures,
                                            uint32_t threshold)
    {
        auto info = GetNetwork(network);
        auto record = m_store.get(name);
        if (!record.supportsNetwork(info.m_tag))
        {
            throw WalletException(ErrorCode::ValidationError, "wallet does not support network " + info.m_tag);
        }
        return m_multisig.assemble(info, to, amount, signatures, threshold);
    }

    RotationResult WalletService::rotateSigningKey(const std::string& name)
    {
        auto record = m_store.get(name);

        crypto::Envelope envelope;
        {
            auto masterKey = openEnvelope(record);
            try
            {
                envelope = m_envelopeCrypto.encryptMasterKey(masterKey, record.getIdentity(), record.m_quantumSafe);
            }
            catch (const crypto::CryptoException&)
            {
                throw WalletException(ErrorCode::CryptoError, "encryption failed");
            }
        }

        const auto label = GetWalletKeyLabel(name);
        m_keyRegistry.ensureLabel(label);
        auto result = m_keyRegistry.rotate(label);

        record.m_envelope = std::move(envelope);
        record.m_updatedAt = unix_timestamp_sec();
        m_store.update(record);

        LOG_INFO() << "Signing key of " << SanitizeForLog(name) << " rotated " << result.m_oldVersion << " -> " << result.m_newVersion;
        return result;
    }

    void WalletService::recordKeyUsage(const std::string& name)
    {
        try
        {
            m_keyRegistry.recordUsage(GetWalletKeyLabel(name));
        }
        catch (const WalletException& ex)
        {
            LOG_WARNING() << "Key usage not recorded: " << ex.what();
        }
    }

    void WalletService::validateName(const std::string& name) const
    {
        static const std::regex kNameRegex("^[A-Za-z0-9_.\\-]+$");
        if (name.empty() || name.size() > kMaxNameLength || !std::regex_match(name, kNameRegex))
        {
            throw WalletException(ErrorCode::ValidationError, "wallet name must be 1-64 characters of letters, digits, '.', '_' or '-'");
        }
    }

    void WalletService::validatePassword(const std::string& password) const
    {
        if (auto violation = m_settings.m_passwordPolicy.validate(password))
        {
            throw WalletException(ErrorCode::ValidationError, *violation);
        }
    }

    void WalletService::addWallet(const std::string& name, crypto::SecureBuffer&& masterKey, const std::string& password, bool quantumSafe)
    {
        crypto::SecureBuffer key(std::move(masterKey));

        WalletRecord record;
        record.m_id = generate_uuid();
        record.m_name = name;
        record.m_createdAt = unix_timestamp_sec();
        record.m_updatedAt = record.m_createdAt;
        record.m_quantumSafe = quantumSafe;
        record.m_networks = GetSupportedNetworks();
        record.m_addresses = DeriveAllAddresses(key, record.m_networks);

        try
        {
            record.m_envelope = m_envelopeCrypto.encryptMasterKey(key, record.getIdentity(), quantumSafe);
            record.m_verifier = crypto::PasswordVerifier::create(password, m_settings.m_pbkdf2Iterations);
        }
        catch (const crypto::CryptoException&)
        {
            throw WalletException(ErrorCode::CryptoError, "encryption failed");
        }
        key.erase();

        m_store.insert(record);
        m_keyRegistry.ensureLabel(GetWalletKeyLabel(name));
    }

    crypto::SecureBuffer WalletService::unlock(const WalletRecord& record, const std::string& password) const
    {
        if (!record.m_verifier.isInitialized() || !record.m_verifier.check(password))
        {
            throw WalletException(ErrorCode::CryptoError, kDecryptionFailed);
        }
        return openEnvelope(record);
    }

    crypto::SecureBuffer WalletService::openEnvelope(const WalletRecord& record) const
    {
        try
        {
            return m_envelopeCrypto.decryptMasterKey(record.m_envelope, record.getIdentity());
        }
        catch (const crypto::CryptoException&)
        {
            throw WalletException(ErrorCode::CryptoError, kDecryptionFailed);
        }
    }

    std::string WalletService::getSourceAddress(const WalletRecord& record, const NetworkInfo& network, const std::string& password) const
    {
        auto it = record.m_addresses.find(network.m_tag);
        if (it == record.m_addresses.end())
        {
            auto masterKey = unlock(record, password);
            return DeriveAddress(masterKey, network.m_tag);
        }

        if (!record.m_verifier.isInitialized() || !record.m_verifier.check(password))
        {
            throw WalletException(ErrorCode::CryptoError, kDecryptionFailed);
        }
        return it->second;
    }
} // namespace warden::wallet
