#pragma once

#include "util.hpp"

#include <optional>
#include <string>

namespace audit_collector {

/// Raw HTTP exchange result; the body is left undecoded.
struct HttpResponse {
    unsigned int               httpStatus = 0;
    std::optional<std::string> retryAfter;   // "Retry-After" header, if sent
    std::string                body;
};

/// Something that can issue one GET.  Throws on transport-level failure
/// (resolve, connect, TLS, timeout); any HTTP status is a normal return.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

/// Synchronous HTTP(S) client built on Boost.Beast.
/// Opens one connection per request and sends the bearer token with it.
class HttpClient : public HttpTransport {
public:
    /// @param bearerToken  Sent as "Authorization: Bearer <token>" (omitted if empty)
    /// @param timeoutMs    Per-operation timeout in milliseconds
    explicit HttpClient(const std::string& bearerToken, int timeoutMs = 30000);

    /// GET an absolute URL.
    /// @throws TransportFailure on resolve, connect, timeout or TLS errors;
    ///         std::invalid_argument on a bad URL.
    HttpResponse get(const std::string& url) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mBearerToken;
    int         mTimeoutMs;
    bool        mVerbose = false;

    HttpResponse doHttpRequest(const UrlParts& parts);
    HttpResponse doHttpsRequest(const UrlParts& parts);
};

} // namespace audit_collector
