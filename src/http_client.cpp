#include "http_client.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

#ifdef AUDIT_COLLECTOR_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace audit_collector {

namespace {

// Events pages can be large; lift Beast's 8 MiB default.
constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

http::request<http::empty_body> buildRequest(const UrlParts& parts,
                                             const std::string& bearerToken) {
    http::request<http::empty_body> req{http::verb::get, parts.target, 11};
    req.set(http::field::host, parts.host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "audit_collector/1.0");
    if (!bearerToken.empty()) {
        req.set(http::field::authorization, "Bearer " + bearerToken);
    }
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.httpStatus = res.result_int();
    auto retryAfter = res.find(http::field::retry_after);
    if (retryAfter != res.end()) {
        const auto value    = retryAfter->value();
        response.retryAfter = std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& bearerToken, int timeoutMs)
    : mBearerToken(bearerToken)
    , mTimeoutMs(timeoutMs)
{
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse HttpClient::get(const std::string& url)
{
    const auto parts = parseUrl(url);

    if (mVerbose) {
        std::cerr << "[HttpClient] GET " << parts.host << ":" << parts.port
                  << parts.target << "\n";
    }

    try {
        return parts.scheme == "https" ? doHttpsRequest(parts)
                                       : doHttpRequest(parts);
    } catch (const boost::system::system_error& e) {
        throw TransportFailure("GET " + parts.host + ":" + parts.port +
                               parts.target + ": " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse HttpClient::doHttpRequest(const UrlParts& parts)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(parts.host, parts.port);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(parts, mBearerToken);

    // Send.
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    // Receive.
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, parser);

    auto res      = parser.release();
    auto response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse HttpClient::doHttpsRequest(const UrlParts& parts)
{
#ifdef AUDIT_COLLECTOR_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname for " + parts.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(parts.host));

    auto const results = resolver.resolve(parts.host, parts.port);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(parts, mBearerToken);

    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, parser);

    auto res      = parser.release();
    auto response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    throw std::runtime_error(
        "HTTPS URL requested but SSL support was not compiled in "
        "(host " + parts.host + "). Rebuild with OpenSSL to enable HTTPS.");
#endif
}

} // namespace audit_collector
