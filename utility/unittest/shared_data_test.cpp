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

#include "utility/shared_data.h"
#include <atomic>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <condition_variable>
#include <string>
#include <vector>

using namespace warden;

class Barrier {
private:
    std::mutex _mutex;
    std::condition_variable _cv;
    size_t _count;
public:
    explicit Barrier(size_t count) : _count(count) { }

    void wait() {
        std::unique_lock<std::mutex> lock{_mutex};
        if (--_count == 0) {
            _cv.notify_all();
        } else {
            _cv.wait(lock, [this] { return _count == 0; });
        }
    }
};

// balance is kept equal to the sum of the entries
struct Ledger {
    std::map<std::string, size_t> entries;
    size_t total = 0;

    bool consistent() const {
        size_t sum = 0;
        for (const auto& p : entries) sum += p.second;
        return sum == total;
    }
};

int main() {
    using namespace std;

    SharedData<Ledger> ledger;

    vector<future<void>> futures;

    size_t nIterations = 20000;
    size_t nReaders = 8;
    size_t nWriters = 2;
    Barrier barrier(nReaders + nWriters);
    atomic<size_t> inconsistent{0};

    for (size_t w=0; w<nWriters; ++w) {
        futures.push_back(std::async(
            std::launch::async,
            [&barrier,&ledger,nIterations,w]() {
                barrier.wait();
                const string key = "writer-" + to_string(w);
                for (size_t i=1; i<=nIterations; ++i) {
                    auto data = ledger.write();
                    data->entries[key] += 1;
                    data->total += 1;
                }
            }
        ));
    }

    for (size_t r=0; r<nReaders; ++r) {
        futures.push_back(std::async(
            std::launch::async,
            [&barrier,&ledger,&inconsistent,nIterations]() {
                barrier.wait();
                for (size_t i=1; i<=nIterations / 10; ++i) {
                    const auto data = ledger.read();
                    if (!data->consistent()) ++inconsistent;
                }
            }
        ));
    }

    for (auto& f : futures) {
        f.get();
    }

    const auto data = ledger.read();
    if (inconsistent != 0 || data->total != nIterations * nWriters || data->entries.size() != nWriters) {
        cout << "shared data test failed, " << inconsistent << " inconsistent reads, total " << data->total << '\n';
        return 1;
    }
    return 0;
}
