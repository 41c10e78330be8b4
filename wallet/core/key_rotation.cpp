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

#include "key_rotation.h"
#include "common.h"

#include "utility/helpers.h"
#include "utility/logger.h"

#include <limits>

namespace warden::wallet
{
    namespace
    {
        KeyVersion MakeVersion(const std::string& label, uint32_t version)
        {
            KeyVersion v;
            v.m_label = label;
            v.m_version = version;
            v.m_keyId = generate_uuid();
            v.m_retired = false;
            v.m_usageCount = 0;
            v.m_createdAt = unix_timestamp_sec();
            return v;
        }

        template <typename Func>
        auto Guard(Func&& func) -> decltype(func())
        {
            try
            {
                return func();
            }
            catch (const DatabaseException&)
            {
                throw WalletException(ErrorCode::StorageError, "key registry storage failure");
            }
        }
    }

    std::string GetWalletKeyLabel(const std::string& walletName)
    {
        return "wallet/" + walletName;
    }

    KeyRotationRegistry::KeyRotationRegistry(IWalletStorage::Ptr storage)
        : m_storage(std::move(storage))
    {
    }

    KeyLabel KeyRotationRegistry::ensureLabel(const std::string& label)
    {
        std::lock_guard<std::mutex> lock(m_rotationMutex);
        return Guard([&]()
        {
            auto current = m_storage->getKeyLabel(label);
            if (current)
            {
                return *current;
            }

            auto first = MakeVersion(label, 1);
            if (!m_storage->insertKeyLabel(first))
            {
                // created by another process in between
                current = m_storage->getKeyLabel(label);
                if (!current)
                {
                    throw WalletException(ErrorCode::StorageError, "cannot create key label");
                }
                return *current;
            }
            return KeyLabel{ first.m_label, first.m_version, first.m_keyId };
        });
    }

    RotationResult KeyRotationRegistry::rotate(const std::string& label)
    {
        std::lock_guard<std::mutex> lock(m_rotationMutex);
        return Guard([&]()
        {
            auto current = m_storage->getKeyLabel(label);
            if (!current)
            {
                throw WalletException(ErrorCode::NotFound, "key label not found: " + label);
            }
            if (current->m_currentVersion == std::numeric_limits<uint32_t>::max())
            {
                throw WalletException(ErrorCode::CapacityFull, "key version counter exhausted: " + label);
            }

            auto next = MakeVersion(label, current->m_currentVersion + 1);
            if (!m_storage->rotateKey(next))
            {
                throw WalletException(ErrorCode::StorageError, "key label was rotated concurrently: " + label);
            }

            LOG_INFO() << "Key rotated: " << label << " v" << current->m_currentVersion << " -> v" << next.m_version;
            return RotationResult{ current->m_currentVersion, next.m_version };
        });
    }

    boost::optional<KeyLabel> KeyRotationRegistry::getCurrent(const std::string& label) const
    {
        return Guard([&]() { return m_storage->getKeyLabel(label); });
    }

    std::vector<KeyVersion> KeyRotationRegistry::getVersions(const std::string& label) const
    {
        return Guard([&]() { return m_storage->getKeyVersions(label); });
    }

    boost::optional<KeyVersion> KeyRotationRegistry::findVersion(const std::string& label, uint32_t version) const
    {
        for (auto& v : getVersions(label))
        {
            if (v.m_version == version)
            {
                return v;
            }
        }
        return {};
    }

    bool KeyRotationRegistry::recordUsage(const std::string& label)
    {
        return Guard([&]()
        {
            auto current = m_storage->getKeyLabel(label);
            if (!current)
            {
                return false;
            }
            return m_storage->incrementKeyUsage(label, current->m_currentVersion);
        });
    }

    void KeyRotationRegistry::remove(const std::string& label)
    {
        std::lock_guard<std::mutex> lock(m_rotationMutex);
        Guard([&]() { m_storage->deleteKeyLabel(label); });
    }
} // namespace warden::wallet
