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

#include "http_client.h"

#include "utility/logger.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <regex>

namespace warden
{
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    namespace ssl   = boost::asio::ssl;

    using tcp = boost::asio::ip::tcp;

    namespace
    {
        const int kHttpVersion = 11;
        const char kUserAgent[] = "warden";

        struct RequestData
        {
            Url m_url;
            bool m_isPost = false;
            std::string m_contentType;
            std::string m_body;
        };

        template<typename Derived>
        class HttpSession
        {
        public:
            HttpSession(boost::asio::io_context& ioc, RequestData&& data, std::chrono::milliseconds timeout, HttpClient::Callback callback)
                : _resolver(boost::asio::make_strand(ioc))
                , _resolveTimer(_resolver.get_executor())
                , _data(std::move(data))
                , _timeout(timeout)
                , _callback(std::move(callback))
            {
            }

            void run()
            {
                _request.version(kHttpVersion);
                _request.method(_data.m_isPost ? http::verb::post : http::verb::get);
                _request.target(_data.m_url.m_target);
                _request.set(http::field::host, _data.m_url.m_host);
                _request.set(http::field::user_agent, kUserAgent);
                _request.set(http::field::accept, "application/json");
                if (_data.m_isPost)
                {
                    _request.set(http::field::content_type, _data.m_contentType);
                    _request.body() = _data.m_body;
                    _request.prepare_payload();
                }

                // the stream deadline only covers connect and later, name lookup gets its own
                _resolveTimer.expires_after(_timeout);
                _resolveTimer.async_wait([sp = GetDerived().shared_from_this()](beast::error_code ec)
                {
                    sp->on_resolve_timeout(ec);
                });

                _resolver.async_resolve(
                    _data.m_url.m_host,
                    _data.m_url.m_port,
                    [sp = GetDerived().shared_from_this()](beast::error_code ec, tcp::resolver::results_type results)
                {
                    sp->on_resolve(ec, results);
                });
            }

            void on_resolve_timeout(beast::error_code ec)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;

                _resolveTimedOut = true;
                _resolver.cancel();
            }

            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                _resolveTimer.cancel();
                if (ec)
                {
                    if (_resolveTimedOut)
                        ec = beast::error::timeout;
                    return fail(ec, "resolve");
                }

                auto& lowest = beast::get_lowest_layer(GetDerived().GetStream());
                lowest.expires_after(_timeout);
                lowest.async_connect(
                    results,
                    [sp = GetDerived().shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type)
                {
                    sp->on_connect(ec);
                });
            }

            void do_write()
            {
                beast::get_lowest_layer(GetDerived().GetStream()).expires_after(_timeout);
                http::async_write(
                    GetDerived().GetStream(),
                    _request,
                    [sp = GetDerived().shared_from_this()](beast::error_code ec, std::size_t bytes)
                {
                    sp->on_write(ec, bytes);
                });
            }

            void on_write(beast::error_code ec, std::size_t bytes_transferred)
            {
                boost::ignore_unused(bytes_transferred);

                if (ec)
                    return fail(ec, "write");

                http::async_read(
                    GetDerived().GetStream(),
                    _buffer,
                    _response,
                    [sp = GetDerived().shared_from_this()](beast::error_code ec, std::size_t bytes)
                {
                    sp->on_read(ec, bytes);
                });
            }

            void on_read(beast::error_code ec, std::size_t bytes_transferred)
            {
                boost::ignore_unused(bytes_transferred);

                if (ec)
                    return fail(ec, "read");

                HttpResponse response;
                response.m_status = _response.result_int();
                response.m_body = std::move(_response.body());
                complete(ec, response);

                GetDerived().do_close();
            }

            Derived& GetDerived()
            {
                return static_cast<Derived&>(*this);
            }

        protected:
            void fail(beast::error_code ec, char const* what)
            {
                LOG_DEBUG() << "http " << what << " failed: " << ec.message();
                complete(ec, HttpResponse());
            }

            void complete(beast::error_code ec, const HttpResponse& response)
            {
                if (_callback)
                {
                    auto callback = std::move(_callback);
                    _callback = nullptr;
                    callback(ec, response);
                }
            }

            std::chrono::milliseconds getTimeout() const
            {
                return _timeout;
            }

            const Url& getUrl() const
            {
                return _data.m_url;
            }

        private:
            tcp::resolver _resolver;
            boost::asio::steady_timer _resolveTimer;
            bool _resolveTimedOut = false;
            RequestData _data;
            std::chrono::milliseconds _timeout;
            HttpClient::Callback _callback;
            beast::flat_buffer _buffer;
            http::request<http::string_body> _request;
            http::response<http::string_body> _response;
        };

        class PlainHttpSession
            : public HttpSession<PlainHttpSession>
            , public std::enable_shared_from_this<PlainHttpSession>
        {
        public:
            PlainHttpSession(boost::asio::io_context& ioc, RequestData&& data, std::chrono::milliseconds timeout, HttpClient::Callback callback)
                : HttpSession<PlainHttpSession>(ioc, std::move(data), timeout, std::move(callback))
                , _stream(boost::asio::make_strand(ioc))
            {
            }

            void on_connect(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "connect");

                do_write();
            }

            void do_close()
            {
                beast::error_code ec;
                _stream.socket().shutdown(tcp::socket::shutdown_both, ec);
                // not_connected happens sometimes so don't bother reporting it.
            }

            auto& GetStream()
            {
                return _stream;
            }

        private:
            beast::tcp_stream _stream;
        };

        class SecureHttpSession
            : public HttpSession<SecureHttpSession>
            , public std::enable_shared_from_this<SecureHttpSession>
        {
        public:
            SecureHttpSession(boost::asio::io_context& ioc, std::shared_ptr<ssl::context> tlsContext, RequestData&& data, std::chrono::milliseconds timeout, HttpClient::Callback callback)
                : HttpSession<SecureHttpSession>(ioc, std::move(data), timeout, std::move(callback))
                , _tlsContext(std::move(tlsContext))
                , _stream(boost::asio::make_strand(ioc), *_tlsContext)
            {
            }

            bool setServerName()
            {
                // SNI, most RPC providers sit behind virtual hosts
                if (!SSL_set_tlsext_host_name(_stream.native_handle(), getUrl().m_host.c_str()))
                {
                    beast::error_code ec{ static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category() };
                    fail(ec, "sni");
                    return false;
                }
                _stream.set_verify_callback(ssl::host_name_verification(getUrl().m_host));
                return true;
            }

            void on_connect(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "connect");

                beast::get_lowest_layer(_stream).expires_after(getTimeout());
                _stream.async_handshake(
                    ssl::stream_base::client,
                    [sp = shared_from_this()](beast::error_code ec)
                {
                    sp->on_handshake(ec);
                });
            }

            void on_handshake(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "handshake");

                do_write();
            }

            void do_close()
            {
                beast::get_lowest_layer(_stream).expires_after(getTimeout());
                _stream.async_shutdown([sp = shared_from_this()](beast::error_code ec)
                {
                    // the peer may close the connection without close_notify, nothing to report
                    boost::ignore_unused(ec);
                });
            }

            auto& GetStream()
            {
                return _stream;
            }

        private:
            std::shared_ptr<ssl::context> _tlsContext;
            beast::ssl_stream<beast::tcp_stream> _stream;
        };
    }

    boost::optional<Url> Url::parse(const std::string& url)
    {
        static const std::regex urlRegex(R"(^(https?)://([^/:]+)(:(\d{1,5}))?(/.*)?$)", std::regex::ECMAScript | std::regex::icase);

        std::smatch match;
        if (!std::regex_match(url, match, urlRegex))
        {
            return {};
        }

        Url res;
        res.m_ssl = match[1].length() == 5;
        res.m_host = match[2].str();
        res.m_port = match[4].matched ? match[4].str() : (res.m_ssl ? "443" : "80");
        res.m_target = match[5].matched ? match[5].str() : "/";
        return res;
    }

    HttpClient::HttpClient(boost::asio::io_context& ioc, unsigned timeoutMsec)
        : m_ioc(ioc)
        , m_sslContext(std::make_shared<ssl::context>(ssl::context::tlsv12_client))
        , m_timeoutMsec(timeoutMsec)
    {
        m_sslContext->set_default_verify_paths();
        m_sslContext->set_verify_mode(ssl::verify_peer);
    }

    void HttpClient::get(const std::string& url, Callback callback)
    {
        sendRequest(false, url, std::string(), std::string(), std::move(callback));
    }

    void HttpClient::post(const std::string& url, const std::string& contentType, const std::string& body, Callback callback)
    {
        sendRequest(true, url, contentType, body, std::move(callback));
    }

    void HttpClient::sendRequest(bool isPost, const std::string& url, const std::string& contentType, const std::string& body, Callback callback)
    {
        auto parsed = Url::parse(url);
        if (!parsed)
        {
            LOG_ERROR() << "unable to parse url";
            auto ec = boost::asio::error::make_error_code(boost::asio::error::invalid_argument);
            boost::asio::post(m_ioc, [callback = std::move(callback), ec]()
            {
                callback(ec, HttpResponse());
            });
            return;
        }

        RequestData data;
        data.m_url = std::move(*parsed);
        data.m_isPost = isPost;
        data.m_contentType = contentType;
        data.m_body = body;

        const std::chrono::milliseconds timeout(m_timeoutMsec);
        if (data.m_url.m_ssl)
        {
            auto session = std::make_shared<SecureHttpSession>(m_ioc, m_sslContext, std::move(data), timeout, std::move(callback));
            if (session->setServerName())
            {
                session->run();
            }
        }
        else
        {
            std::make_shared<PlainHttpSession>(m_ioc, std::move(data), timeout, std::move(callback))->run();
        }
    }

    bool IsTimeout(const boost::system::error_code& ec)
    {
        return ec == beast::error::timeout;
    }
} // namespace warden
