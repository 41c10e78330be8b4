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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace warden
{
    struct Url
    {
        bool m_ssl = false;
        std::string m_host;
        std::string m_port;
        std::string m_target; // path and query, at least "/"

        // http://host[:port]/path or https://host[:port]/path
        static boost::optional<Url> parse(const std::string& url);
    };

    struct HttpResponse
    {
        unsigned m_status = 0;
        std::string m_body;

        bool isSuccess() const { return m_status >= 200 && m_status < 300; }
    };

    /// Asynchronous HTTP/1.1 client, one connection per request.
    /// Callbacks run on the io_context thread. A request that does not complete
    /// within the timeout fails with boost::beast::error::timeout.
    class HttpClient
    {
    public:
        using Callback = std::function<void(const boost::system::error_code&, const HttpResponse&)>;

        HttpClient(boost::asio::io_context& ioc, unsigned timeoutMsec);

        void get(const std::string& url, Callback callback);
        void post(const std::string& url, const std::string& contentType, const std::string& body, Callback callback);

        unsigned getTimeout() const { return m_timeoutMsec; }

    private:
        void sendRequest(bool isPost, const std::string& url, const std::string& contentType, const std::string& body, Callback callback);

        boost::asio::io_context& m_ioc;
        std::shared_ptr<boost::asio::ssl::context> m_sslContext;
        unsigned m_timeoutMsec;
    };

    bool IsTimeout(const boost::system::error_code& ec);
} // namespace warden
