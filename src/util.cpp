#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace audit_collector {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool allDigits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return kDays[m - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::tm toLocalTm(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (!allDigits(parts.port)) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

bool isAbsoluteHttpUrl(const std::string& token) {
    const std::string prefix = toLower(token.substr(0, 8));
    return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

std::chrono::seconds computeBackoff(int attempt, int64_t baseSeconds) {
    if (baseSeconds <= 0) return std::chrono::seconds(0);

    // Shift is clamped so a huge attempt number cannot overflow.
    const int     shift  = std::clamp(attempt - 1, 0, 30);
    const int64_t factor = int64_t{1} << shift;
    if (baseSeconds > kMaxBackoffSeconds / factor) {
        return std::chrono::seconds(kMaxBackoffSeconds);
    }
    return std::chrono::seconds(baseSeconds * factor);
}

std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value) {
    if (!allDigits(value) || value.size() > 9) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::stoll(value));
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query.push_back('&');
        query += urlEncode(key);
        query.push_back('=');
        query += urlEncode(value);
    }
    return query;
}

// ---------------------------------------------------------------------------
// Calendar dates
// ---------------------------------------------------------------------------

std::optional<CalendarDate> parseCalendarDate(const std::string& text) {
    // Strict "YYYY-MM-DD".
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const std::string y = text.substr(0, 4);
    const std::string m = text.substr(5, 2);
    const std::string d = text.substr(8, 2);
    if (!allDigits(y) || !allDigits(m) || !allDigits(d)) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year  = std::stoi(y);
    date.month = std::stoi(m);
    date.day   = std::stoi(d);

    if (date.year < 1 || date.month < 1 || date.month > 12 || date.day < 1 ||
        date.day > daysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

int64_t startOfDayMs(const CalendarDate& date) {
    const int64_t days = daysFromCivil(date.year, date.month, date.day);
    return (days * 86400 - kWindowUtcOffsetSeconds) * 1000;
}

int64_t endOfDayMs(const CalendarDate& date) {
    return startOfDayMs(date) + 86400 * int64_t{1000} - 1;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::tm tm = toLocalTm(tp);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    const std::tm tm = toLocalTm(tp);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace audit_collector
