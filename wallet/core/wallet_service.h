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

#include "common.h"
#include "key_rotation.h"
#include "multisig.h"
#include "nonce_ledger.h"
#include "settings.h"
#include "validation.h"
#include "wallet_store.h"
#include "core/envelope.h"
#include "mnemonic/mnemonic.h"
#include "wallet/bitcoin/bridge.h"
#include "wallet/ethereum/bridge.h"

#include <boost/asio/io_context.hpp>
#include <functional>
#include <string>
#include <vector>

namespace warden::wallet
{
    struct SendResult
    {
        std::string m_txHash;
        std::string m_from;
        uint64_t m_sequence = 0;   // ledger token reserved for this send
        uint64_t m_chainNonce = 0; // ethereum only
        Amount m_fee = 0;          // bitcoin only
    };

    struct Balance
    {
        BaseUnits m_value = 0;
        std::string m_formatted;
    };

    /// Key custody and signing engine. Owns the wallet map, the nonce ledger and the
    /// key registry of one storage. Synchronous operations throw WalletException,
    /// network-bound ones report through their callback.
    class WalletService
    {
    public:
        using EthereumBridgeFactory = std::function<ethereum::IBridge::Ptr(const NetworkInfo&, const std::string& rpcUrl)>;
        using BitcoinBridgeFactory = std::function<bitcoin::IBridge::Ptr(const std::string& indexerUrl)>;
        using SendCallback = std::function<void(const Error&, const SendResult&)>;
        using BalanceCallback = std::function<void(const Error&, const Balance&)>;

        WalletService(boost::asio::io_context& ioc,
                      IWalletStorage::Ptr storage,
                      const crypto::KekRing& keks,
                      const ServiceSettings& settings);

        // replace the HTTP bridges, used by tests
        void setEthereumBridgeFactory(EthereumBridgeFactory factory);
        void setBitcoinBridgeFactory(BitcoinBridgeFactory factory);
        void setMultisigBroadcaster(MultisigBroadcaster broadcaster);

        // Returns the recovery words. They are not kept anywhere.
        WordList createWallet(const std::string& name, const std::string& password, bool quantumSafe);
        void restoreWallet(const std::string& name, const std::string& mnemonic, const std::string& password, bool quantumSafe);
        // removes the record, its nonce entries and its key label
        void deleteWallet(const std::string& name);
        std::vector<WalletSummary> listWallets() const;

        std::string getAddress(const std::string& name, const std::string& network, const std::string& password) const;
        void getBalance(const std::string& name, const std::string& network, const std::string& password, BalanceCallback callback);

        void sendTransaction(const std::string& name,
                             const std::string& to,
                             const std::string& amount,
                             const std::string& network,
                             const std::string& password,
                             SendCallback callback);

        std::string sendMultiSig(const std::string& name,
                                 const std::string& network,
                                 const std::string& to,
                                 const std::string& amount,
                                 const std::vector<std::string>& signatures,
                                 uint32_t threshold);

        // new key version in the registry, master key re-encrypted under a fresh salt and nonce
        RotationResult rotateSigningKey(const std::string& name);

        NonceLedger& getNonceLedger() { return m_nonceLedger; }
        KeyRotationRegistry& getKeyRegistry() { return m_keyRegistry; }
        const ServiceSettings& getSettings() const { return m_settings; }

    private:
        void validateName(const std::string& name) const;
        void recordKeyUsage(const std::string& name);
        void validatePassword(const std::string& password) const;
        void addWallet(const std::string& name, crypto::SecureBuffer&& masterKey, const std::string& password, bool quantumSafe);

        // password gate, then envelope. Failures are the generic CryptoError.
        crypto::SecureBuffer unlock(const WalletRecord& record, const std::string& password) const;
        crypto::SecureBuffer openEnvelope(const WalletRecord& record) const;
        std::string getSourceAddress(const WalletRecord& record, const NetworkInfo& network, const std::string& password) const;

        void sendEthereum(const WalletRecord& record, const NetworkInfo& network, const std::string& from,
                          const std::string& to, const BaseUnits& value, SendCallback callback);
        void sendBitcoin(const WalletRecord& record, const NetworkInfo& network, const std::string& from,
                         const std::string& to, const BaseUnits& value, SendCallback callback);
        void onSent(const WalletRecord& record, const NetworkInfo& network, const Error& error, SendResult result, const SendCallback& callback);

        boost::asio::io_context& m_ioc;
        ServiceSettings m_settings;
        crypto::EnvelopeCrypto m_envelopeCrypto;
        WalletStore m_store;
        NonceLedger m_nonceLedger;
        KeyRotationRegistry m_keyRegistry;
        MultisigCoordinator m_multisig;
        EthereumBridgeFactory m_ethereumBridgeFactory;
        BitcoinBridgeFactory m_bitcoinBridgeFactory;
    };
} // namespace warden::wallet
