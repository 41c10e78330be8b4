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

#include "config.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace warden {

namespace {

using json = nlohmann::json;

void filter_comments(std::string& line) {
    if (line.empty()) return;
    if (line[0] == '#') {
        line.clear();
        return;
    }
    int nQuotes = 0;
    char prev = line[0];
    for (size_t i = 1; i < line.size(); ++i) {
        char c = line[i];
        if (c == '#' && (nQuotes % 2) == 0) {
            line.resize(i);
            return;
        }
        if (c == '"' && prev != '\\') ++nQuotes;
        prev = c;
    }
}

std::string filter(std::istream& in) {
    std::string filtered;
    std::string line;
    while (std::getline(in, line)) {
        filter_comments(line);
        filtered.append(line);
        filtered.push_back('\n');
    }
    return filtered;
}

using Values = std::unordered_map<std::string, std::any>;

template <typename T> std::any array_values(const json& o) {
    std::vector<T> vec;
    for (const auto& x : o) {
        vec.push_back(x.get<T>());
    }
    return std::any(std::move(vec));
}

void add_array(Values& v, const json& o, const std::string& name) {
    if (o.empty()) return;
    switch (o[0].type()) {
        case json::value_t::string:
            v[name] = array_values<std::string>(o);
            break;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            v[name] = array_values<int64_t>(o);
            break;
        default:
            break;
    }
}

void add_object(Values& v, const json& o, const std::string& name) {
    switch (o.type()) {
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            v[name] = std::any(o.get<int64_t>());
            break;
        case json::value_t::boolean:
            v[name] = std::any(o.get<bool>());
            break;
        case json::value_t::string:
            v[name] = std::any(o.get<std::string>());
            break;
        case json::value_t::number_float:
            v[name] = std::any(o.get<double>());
            break;
        case json::value_t::object:
            for (json::const_iterator it = o.begin(); it != o.end(); ++it) {
                add_object(v, it.value(), name + "." + it.key());
            }
            break;
        case json::value_t::array:
            add_array(v, o, name);
            break;
        default:
            break;
    }
}

void parse_into(Values& values, const std::string& filtered, const std::string& source) {
    if (filtered.find_first_not_of(" \t\r\n") == std::string::npos)
        throw std::runtime_error(std::string("empty config ") + source);

    json j = json::parse(filtered);
    if (!j.is_object()) throw std::runtime_error(std::string("bad config format ") + source);

    for (json::iterator it = j.begin(); it != j.end(); ++it) {
        add_object(values, it.value(), it.key());
    }
}

} //namespace

void Config::load(const std::string& fileName) {
    std::ifstream file(fileName);
    if (!file) throw std::runtime_error(std::string("cannot open config file ") + fileName);
    parse_into(_values, filter(file), fileName);
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse_into(_values, filter(in), "<string>");
}

std::vector<std::string> Config::get_keys_with_prefix(const std::string& prefix) const {
    std::vector<std::string> keys;
    for (const auto& p : _values) {
        if (p.first.size() > prefix.size() && p.first.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(p.first.substr(prefix.size()));
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

static Config g_config;

const Config& config() {
    return g_config;
}

void reset_global_config(Config&& c) {
    if (!g_config.empty()) throw std::runtime_error("reset non-empty config");
    g_config = std::move(c);
}

} //namespace
