#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace audit_collector {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/orgs/X/events-stream?limit=5")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// True if @p token starts with "http://" or "https://" (scheme is
/// case-insensitive).
bool isAbsoluteHttpUrl(const std::string& token);

/// Longest single backoff wait (one day).
constexpr int64_t kMaxBackoffSeconds = 24 * 3600;

/// Exponential backoff: base * 2^(attempt-1), capped at kMaxBackoffSeconds.
/// attempt is 1-based.
std::chrono::seconds computeBackoff(int attempt, int64_t baseSeconds);

/// Parse a Retry-After header value.  Only a plain non-negative decimal
/// integer is accepted; anything else (HTTP-dates included) yields nullopt.
std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value);

/// Percent-encode a query component (RFC 3986 unreserved set is kept).
std::string urlEncode(const std::string& value);

/// Render "k1=v1&k2=v2" with values percent-encoded.
std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params);

// ---------------------------------------------------------------------------
// Calendar dates
// ---------------------------------------------------------------------------

struct CalendarDate {
    int year  = 1970;
    int month = 1;
    int day   = 1;
};

/// Fixed offset used to turn calendar dates into instants (UTC+9).
constexpr int64_t kWindowUtcOffsetSeconds = 9 * 3600;

/// Parse "YYYY-MM-DD".  Returns nullopt for anything malformed or for a day
/// that does not exist (e.g. 2023-02-29).
std::optional<CalendarDate> parseCalendarDate(const std::string& text);

/// Epoch milliseconds of 00:00:00.000 at UTC+9 on @p date.
int64_t startOfDayMs(const CalendarDate& date);

/// Epoch milliseconds of 23:59:59.999 at UTC+9 on @p date.
int64_t endOfDayMs(const CalendarDate& date);

/// Local wall-clock rendering "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

/// Local ISO-8601 rendering "YYYY-MM-DDTHH:MM:SS".
std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace audit_collector
