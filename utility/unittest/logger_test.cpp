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

#include "utility/logger.h"
#include "utility/helpers.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>

using namespace warden;
using namespace std;

static int error_count = 0;

#define CHECK(s) \
do {\
    if (!(s)) {\
        cout << "\"" << #s << "\" failed at line " << __LINE__ << '\n';\
        ++error_count;\
    }\
} while(false)\

struct XXX {
    int z = 333;
};

std::ostream& operator<<(std::ostream& os, const XXX& xxx) {
    os << "XXX={" << xxx.z << "}";
    return os;
}

static size_t custom_header_formatter(char* buf, size_t maxSize, const char* timestampFormatted, const LogMessageHeader& header) {
    return snprintf(buf, maxSize, "%c %s ", loglevel_tag(header.level), timestampFormatted);
}

static string read_file(const string& path) {
    ifstream file(path);
    stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void test_console_logger() {
    auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_DEBUG);
    logger->set_header_formatter(custom_header_formatter);
    logger->set_time_format("%T", false);

    LOG_CRITICAL() << "Critical at " << format_timestamp("%y-%m-%d.%T", local_timestamp_msec());
    LOG_ERROR() << "Error";
    LOG_WARNING() << "Warning: " << 223322223;
    XXX xxx;
    LOG_INFO() << xxx;
    LOG_DEBUG() << "Debug";
    LOG_VERBOSE() << "Verbose";

    CHECK(Logger::will_log(LOG_LEVEL_INFO));
    CHECK(!Logger::will_log(LOG_LEVEL_VERBOSE));
    CHECK(logger->get_current_file_name().empty());

    bool thrown = false;
    try {
        auto second = Logger::create();
    } catch (const exception&) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_file_logger() {
    auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("warden-log-%%%%-%%%%");
    string fileName;
    {
        auto logger = Logger::create(LOG_LEVEL_INFO, LOG_SINK_DISABLED, LOG_LEVEL_INFO, "test_", dir.string());
        fileName = logger->get_current_file_name();
        CHECK(!fileName.empty());
        CHECK(boost::filesystem::exists(dir));
        CHECK(boost::filesystem::path(fileName).filename().string().find("test_") == 0);

        LOG_WARNING() << "wallet w1 created";
        LOG_INFO() << XXX();
        LOG_DEBUG() << "hidden debug line";

        logger->rotate();
        CHECK(boost::filesystem::exists(logger->get_current_file_name()));
    }
    CHECK(!Logger::will_log(LOG_LEVEL_CRITICAL));

    auto content = read_file(fileName);
    CHECK(content.find("wallet w1 created") != string::npos);
    CHECK(content.find("XXX={333}") != string::npos);
    CHECK(content.find("hidden debug line") == string::npos);

    boost::filesystem::remove_all(dir);
}

void test_log_levels() {
    CHECK(parse_log_level("info", 0) == LOG_LEVEL_INFO);
    CHECK(parse_log_level("WARNING", 0) == LOG_LEVEL_WARNING);
    CHECK(parse_log_level("off", LOG_LEVEL_INFO) == LOG_SINK_DISABLED);
    CHECK(parse_log_level("loud", LOG_LEVEL_DEBUG) == LOG_LEVEL_DEBUG);
    CHECK(loglevel_tag(LOG_LEVEL_ERROR) == 'E');
    CHECK(loglevel_tag(100) == '~');

    bool thrown = false;
    try {
        Logger::create(LOG_LEVEL_WARNING, LOG_SINK_DISABLED, LOG_SINK_DISABLED);
    } catch (const exception&) {
        thrown = true;
    }
    CHECK(thrown);
}

int main() {
    try {
        test_log_levels();
        test_console_logger();
        test_file_logger();
    }
    catch (const exception& e) {
        cout << "Exception: " << e.what() << '\n';
        ++error_count;
    }
    return error_count;
}
