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

#include "address.h"

#include "wallet/bitcoin/common.h"
#include "wallet/ethereum/common.h"

#include <algorithm>

namespace warden::wallet
{
    void ExtractSecret(const crypto::SecureBuffer& masterKey, libbitcoin::ec_secret& secret)
    {
        if (masterKey.size() != secret.size())
        {
            throw WalletException(ErrorCode::ValidationError, "master key must be 32 bytes");
        }

        std::copy_n(masterKey.data(), secret.size(), secret.begin());
        if (!libbitcoin::verify(secret))
        {
            crypto::SecureErase(secret);
            throw WalletException(ErrorCode::CryptoError, kSigningFailed);
        }
    }

    std::string DeriveAddress(const crypto::SecureBuffer& masterKey, const std::string& network)
    {
        auto info = GetNetwork(network);

        crypto::NoLeak<libbitcoin::ec_secret> secret;
        ExtractSecret(masterKey, secret.V);

        try
        {
            switch (info.m_type)
            {
            case NetworkType::Ethereum:
                return ethereum::ConvertEthAddressToChecksumStr(ethereum::GetEthAddressFromSecret(secret.V));
            case NetworkType::Bitcoin:
                return bitcoin::getAddressFromSecret(secret.V, bitcoin::getAddressVersion());
            }
        }
        catch (const std::invalid_argument&)
        {
            throw WalletException(ErrorCode::CryptoError, kSigningFailed);
        }

        throw WalletException(ErrorCode::ValidationError, "unsupported network: " + network);
    }

    std::map<std::string, std::string> DeriveAllAddresses(const crypto::SecureBuffer& masterKey, const std::vector<std::string>& networks)
    {
        std::map<std::string, std::string> addresses;
        for (const auto& network : networks)
        {
            addresses[network] = DeriveAddress(masterKey, network);
        }
        return addresses;
    }
} // namespace warden::wallet
