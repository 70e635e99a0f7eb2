/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, backoff, query encoding and
/// calendar-date window boundaries.

#include "util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace audit_collector;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:8080/orgs/X/events-stream");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.target, "/orgs/X/events-stream");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://api.atlassian.com/admin/v1/orgs/abc/events-stream");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "api.atlassian.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/admin/v1/orgs/abc/events-stream");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
}

TEST(ParseUrl, QueryStringStaysInTarget) {
    auto parts = parseUrl("https://api.example.com/orgs/X/events?limit=500&cursor=abc");
    EXPECT_EQ(parts.host, "api.example.com");
    EXPECT_EQ(parts.target, "/orgs/X/events?limit=500&cursor=abc");
}

TEST(ParseUrl, QueryWithoutPathGetsLeadingSlash) {
    auto parts = parseUrl("http://example.com?cursor=1");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.target, "/?cursor=1");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://example.com");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, SchemeIsCaseInsensitive) {
    auto parts = parseUrl("HTTPS://Example.com/x");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.port, "443");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:8080/events"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/file"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///events"), std::invalid_argument);
}

TEST(ParseUrl, NonNumericPortThrows) {
    EXPECT_THROW(parseUrl("http://example.com:abc/events"), std::invalid_argument);
}

// ============================================================================
// isAbsoluteHttpUrl
// ============================================================================

TEST(IsAbsoluteHttpUrl, RecognisesBothSchemes) {
    EXPECT_TRUE(isAbsoluteHttpUrl("http://x/y"));
    EXPECT_TRUE(isAbsoluteHttpUrl("https://api.example.com/orgs/X/events?cursor=abc"));
    EXPECT_TRUE(isAbsoluteHttpUrl("HTTPS://API.EXAMPLE.COM/"));
}

TEST(IsAbsoluteHttpUrl, OpaqueCursorsAreNotUrls) {
    EXPECT_FALSE(isAbsoluteHttpUrl("c1"));
    EXPECT_FALSE(isAbsoluteHttpUrl("eyJ0aW1lIjoxNjk5fQ=="));
    EXPECT_FALSE(isAbsoluteHttpUrl("httpish-cursor"));
    EXPECT_FALSE(isAbsoluteHttpUrl(""));
}

// ============================================================================
// computeBackoff
// ============================================================================

TEST(ComputeBackoff, DoublesFromBase) {
    EXPECT_EQ(computeBackoff(1, 3).count(), 3);
    EXPECT_EQ(computeBackoff(2, 3).count(), 6);
    EXPECT_EQ(computeBackoff(3, 3).count(), 12);
    EXPECT_EQ(computeBackoff(4, 3).count(), 24);
}

TEST(ComputeBackoff, ZeroBaseNeverWaits) {
    for (int attempt = 1; attempt < 6; ++attempt) {
        EXPECT_EQ(computeBackoff(attempt, 0).count(), 0);
    }
}

TEST(ComputeBackoff, HugeAttemptDoesNotOverflow) {
    EXPECT_GT(computeBackoff(500, 1).count(), 0);
}

TEST(ComputeBackoff, CappedAtOneDay) {
    EXPECT_EQ(computeBackoff(18, 1).count(), 86400);
    EXPECT_EQ(computeBackoff(17, 1).count(), 65536);
    EXPECT_EQ(computeBackoff(40, 2000000000).count(), kMaxBackoffSeconds);
    EXPECT_EQ(computeBackoff(1, int64_t{1} << 62).count(), kMaxBackoffSeconds);

    // The capped wait still converts to milliseconds without overflow.
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        computeBackoff(64, 2000000000));
    EXPECT_EQ(ms.count(), kMaxBackoffSeconds * 1000);
}

TEST(ComputeBackoff, NegativeBaseNeverWaits) {
    EXPECT_EQ(computeBackoff(3, -4).count(), 0);
}

// ============================================================================
// parseRetryAfter
// ============================================================================

TEST(ParseRetryAfter, AcceptsPlainIntegers) {
    ASSERT_TRUE(parseRetryAfter("0").has_value());
    EXPECT_EQ(parseRetryAfter("0")->count(), 0);
    EXPECT_EQ(parseRetryAfter("17")->count(), 17);
}

TEST(ParseRetryAfter, RejectsEverythingElse) {
    EXPECT_FALSE(parseRetryAfter("").has_value());
    EXPECT_FALSE(parseRetryAfter("-1").has_value());
    EXPECT_FALSE(parseRetryAfter("1.5").has_value());
    EXPECT_FALSE(parseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
    EXPECT_FALSE(parseRetryAfter(" 5").has_value());
}

// ============================================================================
// Query encoding
// ============================================================================

TEST(UrlEncode, KeepsUnreservedCharacters) {
    EXPECT_EQ(urlEncode("abcXYZ019-_.~"), "abcXYZ019-_.~");
}

TEST(UrlEncode, EscapesReservedCharacters) {
    EXPECT_EQ(urlEncode("a b"), "a%20b");
    EXPECT_EQ(urlEncode("x=1&y"), "x%3D1%26y");
    EXPECT_EQ(urlEncode("c+/="), "c%2B%2F%3D");
}

TEST(BuildQueryString, JoinsInOrder) {
    EXPECT_EQ(buildQueryString({{"limit", "500"}, {"from", "1"}, {"to", "2"}}),
              "limit=500&from=1&to=2");
    EXPECT_EQ(buildQueryString({}), "");
}

// ============================================================================
// Calendar dates (UTC+9 boundaries)
// ============================================================================

TEST(ParseCalendarDate, ValidDate) {
    auto d = parseCalendarDate("2024-03-15");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year, 2024);
    EXPECT_EQ(d->month, 3);
    EXPECT_EQ(d->day, 15);
}

TEST(ParseCalendarDate, LeapDays) {
    EXPECT_TRUE(parseCalendarDate("2024-02-29").has_value());
    EXPECT_FALSE(parseCalendarDate("2023-02-29").has_value());
    EXPECT_TRUE(parseCalendarDate("2000-02-29").has_value());
    EXPECT_FALSE(parseCalendarDate("1900-02-29").has_value());
}

TEST(ParseCalendarDate, MalformedInputs) {
    EXPECT_FALSE(parseCalendarDate("").has_value());
    EXPECT_FALSE(parseCalendarDate("2024/01/01").has_value());
    EXPECT_FALSE(parseCalendarDate("2024-1-01").has_value());
    EXPECT_FALSE(parseCalendarDate("2024-13-01").has_value());
    EXPECT_FALSE(parseCalendarDate("2024-04-31").has_value());
    EXPECT_FALSE(parseCalendarDate("2024-00-10").has_value());
    EXPECT_FALSE(parseCalendarDate("abcd-ef-gh").has_value());
}

TEST(DayWindow, StartOfDayIsMidnightAtPlusNine) {
    // 2024-01-01T00:00:00+09:00 == 2023-12-31T15:00:00Z
    EXPECT_EQ(startOfDayMs({2024, 1, 1}), 1704034800000LL);
}

TEST(DayWindow, EndOfDayIsLastMillisecond) {
    // 2024-01-01T23:59:59.999+09:00
    EXPECT_EQ(endOfDayMs({2024, 1, 1}), 1704121199999LL);
}

TEST(DayWindow, EpochDay) {
    // 1970-01-01T00:00:00+09:00 is nine hours before the epoch.
    EXPECT_EQ(startOfDayMs({1970, 1, 1}), -9LL * 3600 * 1000);
}

TEST(DayWindow, SameDayWindowSpansOneDay) {
    const CalendarDate d{2024, 2, 29};
    EXPECT_EQ(endOfDayMs(d) - startOfDayMs(d), 86400LL * 1000 - 1);
}
