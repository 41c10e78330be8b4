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
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace warden {

/// Data guarded by a single reader-writer lock.
/// Readers share the lock, a writer holds it exclusively for the lifetime of the accessor.
template <class Data> class SharedData {
    mutable std::shared_mutex _rwLock;
    Data _data;

public:

    class Reader {
    public:
        Reader(const Reader&)=delete;
        Reader& operator=(const Reader&)=delete;
        Reader(Reader&&)=default;

        const Data* operator->() const { return _data; }
        const Data& operator*() const { return *_data; }

    private:
        friend SharedData;

        explicit Reader(const SharedData* owner)
            : _lock(owner->_rwLock)
            , _data(&owner->_data)
        {}

        std::shared_lock<std::shared_mutex> _lock;
        const Data* _data;
    };

    class Writer {
    public:
        Writer(const Writer&)=delete;
        Writer& operator=(const Writer&)=delete;
        Writer(Writer&&)=default;

        Data* operator->() { return _data; }
        Data& operator*() { return *_data; }

    private:
        friend SharedData;

        explicit Writer(SharedData* owner)
            : _lock(owner->_rwLock)
            , _data(&owner->_data)
        {}

        std::unique_lock<std::shared_mutex> _lock;
        Data* _data;
    };

    SharedData() = default;
    SharedData(const SharedData&) = delete;
    SharedData& operator=(const SharedData&) = delete;

    explicit SharedData(Data&& d) : _data(std::move(d)) {}

    Reader read() const {
        return Reader(this);
    }

    Writer write() {
        return Writer(this);
    }
};

} //namespace
