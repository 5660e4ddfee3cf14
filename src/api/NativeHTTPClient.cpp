#include "api/NativeHTTPClient.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <regex>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct NativeHTTPClient::Impl {
    net::io_context ioc;
    std::chrono::steady_clock::time_point deadline;

    // Drive the io_context until the pending step has completed.
    // The stream's expiry closes the socket at the deadline, so this returns
    // with beast::error::timeout instead of blocking.
    void await(const beast::error_code& ec, const char* step)
    {
        ioc.restart();
        ioc.run();
        if (ec) {
            throw beast::system_error(ec, step);
        }
    }
};

NativeHTTPClient::NativeHTTPClient()
    : m_impl(std::make_unique<Impl>())
    , m_bodyLimit(64 * 1024 * 1024)
    , m_timeout(30000)
{
}

NativeHTTPClient::~NativeHTTPClient() = default;

template <class Stream>
void NativeHTTPClient::exchange(Stream& stream, const std::string& host, const std::string& target,
                                const std::map<std::string, std::string>& headers, Response& response)
{
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "OptionChainEngine/1.0");
    for (const auto& [key, value] : headers) {
        req.set(key, value);
    }

    beast::error_code ec = net::error::would_block;
    beast::get_lowest_layer(stream).expires_at(m_impl->deadline);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    m_impl->await(ec, "write");

    // Full daily history for one ticker is a few MB of JSON
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(m_bodyLimit);

    ec = net::error::would_block;
    beast::get_lowest_layer(stream).expires_at(m_impl->deadline);
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    m_impl->await(ec, "read");

    http::response<http::string_body> res = parser.release();

    response.statusCode = res.result_int();
    response.body = std::move(res.body());
    for (auto const& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.success = (response.statusCode >= 200 && response.statusCode < 300);
}

NativeHTTPClient::Response NativeHTTPClient::get(const std::string& url,
                                                 const std::map<std::string, std::string>& headers)
{
    Response response;

    std::regex urlRegex(R"(^(https?)://([^:/]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        response.error = "Invalid URL format";
        return response;
    }

    const std::string protocol = match[1].str();
    const std::string host = match[2].str();
    std::string port = match[3].str();
    std::string target = match[4].str();

    if (target.empty()) target = "/";
    if (port.empty()) {
        port = (protocol == "https") ? "443" : "80";
    }

    m_impl->deadline = std::chrono::steady_clock::now() + m_timeout;

    try {
        // The system resolver has no deadline of its own; its time counts against ours
        tcp::resolver resolver(m_impl->ioc);
        auto const results = resolver.resolve(host, port);

        beast::error_code ec = net::error::would_block;

        if (protocol == "https") {
            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(m_impl->ioc, ctx);

            // SNI
            if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "Failed to set SNI hostname");
            }

            beast::get_lowest_layer(stream).expires_at(m_impl->deadline);
            beast::get_lowest_layer(stream).async_connect(
                results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            m_impl->await(ec, "connect");

            ec = net::error::would_block;
            beast::get_lowest_layer(stream).expires_at(m_impl->deadline);
            stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
            m_impl->await(ec, "handshake");

            exchange(stream, host, target, headers, response);

            // Servers commonly close without close_notify; the outcome is not reported
            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(500));
            stream.async_shutdown([](beast::error_code) {});
            m_impl->ioc.restart();
            m_impl->ioc.run();
        } else {
            beast::tcp_stream stream(m_impl->ioc);

            stream.expires_at(m_impl->deadline);
            stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            m_impl->await(ec, "connect");

            exchange(stream, host, target, headers, response);

            beast::error_code shutdownEc;
            stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);
        }
    } catch (beast::system_error const& e) {
        response.timedOut = (e.code() == beast::error::timeout);
        response.error = e.what();
        response.success = false;
    } catch (std::exception const& e) {
        response.error = e.what();
        response.success = false;
    }

    return response;
}
