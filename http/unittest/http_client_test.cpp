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

#include "http/http_client.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <iostream>

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

namespace
{
    struct Outcome
    {
        bool m_called = false;
        boost::system::error_code m_error;
    };

    Outcome Get(HttpClient& client, boost::asio::io_context& ioc, const string& url, chrono::seconds limit)
    {
        Outcome outcome;
        client.get(url, [&outcome](const boost::system::error_code& ec, const HttpResponse&)
        {
            outcome.m_called = true;
            outcome.m_error = ec;
        });
        ioc.run_for(limit);
        return outcome;
    }
}

void UrlTest()
{
    auto url = Url::parse("https://mainnet.example.org/v3/key");
    CHECK(url);
    CHECK(url->m_ssl);
    CHECK(url->m_host == "mainnet.example.org");
    CHECK(url->m_port == "443");
    CHECK(url->m_target == "/v3/key");

    url = Url::parse("http://127.0.0.1:8545");
    CHECK(url);
    CHECK(!url->m_ssl);
    CHECK(url->m_port == "8545");
    CHECK(url->m_target == "/");

    CHECK(!Url::parse("ftp://example.org/"));
    CHECK(!Url::parse("http://"));
}

void BadUrlTest()
{
    boost::asio::io_context ioc;
    HttpClient client(ioc, 1000);
    auto outcome = Get(client, ioc, "not a url", chrono::seconds(1));
    CHECK(outcome.m_called);
    CHECK(outcome.m_error == boost::asio::error::invalid_argument);
}

void RefusedTest()
{
    boost::asio::io_context ioc;
    HttpClient client(ioc, 2000);
    auto outcome = Get(client, ioc, "http://127.0.0.1:1/", chrono::seconds(5));
    CHECK(outcome.m_called);
    CHECK(outcome.m_error);
}

void ResolveDeadlineTest()
{
    // a lookup that outlives the request timeout still completes the request
    boost::asio::io_context ioc;
    HttpClient client(ioc, 1);
    auto outcome = Get(client, ioc, "http://warden-lookup.invalid/", chrono::seconds(3));
    CHECK(outcome.m_called);
    CHECK(outcome.m_error);
}

int main()
{
    UrlTest();
    BadUrlTest();
    RefusedTest();
    ResolveDeadlineTest();

    return error_count;
}
