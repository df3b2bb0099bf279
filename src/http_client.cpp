#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef BILI_TRENDS_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace bili_trends {

namespace {

http::request<http::empty_body>
buildRequest(const std::string& host, const std::string& target,
             const HttpHeaders& headers)
{
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json, text/plain, */*");
    req.set(http::field::user_agent, "bili_trends/1.0");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(baseUrl);
    mHost   = parts.host;
    mPort   = parts.port;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef BILI_TRENDS_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpTransport::Response
HttpClient::get(const std::string& target, const HttpHeaders& headers)
{
    if (mVerbose) {
        std::cerr << "[Http] GET " << mHost << ":" << mPort;
        if (target.size() <= 300) {
            std::cerr << target << "\n";
        } else {
            std::cerr << target.substr(0, 300) << " ...(truncated)\n";
        }
    }

    try {
        return mUseSsl ? doHttpsRequest(target, headers)
                       : doHttpRequest(target, headers);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string("HTTP request failed: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpTransport::Response
HttpClient::doHttpRequest(const std::string& target, const HttpHeaders& headers)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(mHost, target, headers);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[Http] HTTP " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpTransport::Response
HttpClient::doHttpsRequest(const std::string& target, const HttpHeaders& headers)
{
#ifdef BILI_TRENDS_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(mHost, target, headers);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[Http] HTTPS " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)target;
    (void)headers;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace bili_trends
