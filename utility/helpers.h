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
#include <string>
#include <functional>
#include <stdint.h>

namespace warden {

// returns local timestamp in millisecond since the Epoch
uint64_t local_timestamp_msec();

// returns seconds since the Epoch, used for persisted created/updated columns
uint64_t unix_timestamp_sec();

// formatStr as for strftime (e.g. "%Y-%m-%d.%T"), if decimals==true, then .### milliseconds added
// returns bytes consumed
size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec=true);

// formats current timestamp into std::string
inline std::string format_timestamp(const char* formatStr, uint64_t timestamp, bool formatMsec=true) {
    char buf[128];
    size_t n = format_timestamp(buf, 128, formatStr, timestamp, formatMsec);
    return std::string(buf, n);
}

/// Wraps member fn into std::function via lambda
template <typename R, typename ...Args, typename T> std::function<R(Args...)> bind_memfn(T* object, R(T::*fn)(Args...)) {
    return [object, fn](Args ...args) { return (object->*fn)(std::forward<Args>(args)...); };
}

/// returns current thread id depending on platform
uint64_t get_thread_id();

/// Generates a random RFC 4122 identifier in canonical text form
std::string generate_uuid();

} //namespace
