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

#include "wallet_db.h"

#include <boost/optional.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace warden::wallet
{
    struct RotationResult
    {
        uint32_t m_oldVersion = 0;
        uint32_t m_newVersion = 0;
    };

    /// Versioned key identities per label. Exactly one version of a label is current
    /// and not retired, older versions stay queryable.
    class KeyRotationRegistry
    {
    public:
        explicit KeyRotationRegistry(IWalletStorage::Ptr storage);

        // creates version 1 if the label is unknown, returns the current pointer
        KeyLabel ensureLabel(const std::string& label);

        // throws NotFound for unknown labels
        RotationResult rotate(const std::string& label);

        boost::optional<KeyLabel> getCurrent(const std::string& label) const;
        std::vector<KeyVersion> getVersions(const std::string& label) const;
        boost::optional<KeyVersion> findVersion(const std::string& label, uint32_t version) const;

        // increments usageCount of the current version, false if the label is unknown
        bool recordUsage(const std::string& label);

        void remove(const std::string& label);

    private:
        IWalletStorage::Ptr m_storage;
        std::mutex m_rotationMutex;
    };

    std::string GetWalletKeyLabel(const std::string& walletName);
} // namespace warden::wallet
