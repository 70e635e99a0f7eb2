/// @file test_retry_client.cpp
/// Unit tests for retry_client.hpp: rate-limit waits, hard-failure backoff,
/// budget exhaustion and empty-body tolerance.  Sleeps are recorded, not taken.

#include "errors.hpp"
#include "fake_transport.hpp"
#include "retry_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace audit_collector;
using namespace audit_collector::testing_support;
using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

Settings testSettings(int maxRetries, int baseSeconds) {
    Settings s;
    s.orgId            = "org-1";
    s.apiToken         = "token";
    s.baseUrl          = "http://localhost:9/orgs";
    s.pageSize         = 2;
    s.maxRetries       = maxRetries;
    s.retryBaseSeconds = baseSeconds;
    return s;
}

PageRequest firstPage(const Settings& s) {
    QueryPage q;
    q.baseUrl       = s.eventsEndpoint();
    q.limit         = s.pageSize;
    q.windowStartMs = 100;
    q.windowEndMs   = 200;
    return PageRequest{q};
}

std::vector<std::string> messages(ProgressChannel& channel) {
    std::vector<std::string> out;
    for (const auto& ev : channel.drain()) out.push_back(ev.message);
    return out;
}

const std::string kOkBody = json{
    {"data", json::array({{{"id", "e1"}}, {{"id", "e2"}}})},
    {"meta", {{"next", "c1"}}}
}.dump();

} // namespace

// ============================================================================
// Success paths
// ============================================================================

TEST(RetryClient, FirstAttemptSuccess) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().events.size(), 2u);
    EXPECT_EQ(result.value().nextToken, "c1");
    EXPECT_TRUE(sleeper.waits.empty());
    EXPECT_EQ(client.getStats().totalRequests, 1);
    EXPECT_EQ(client.getStats().totalRetries, 0);

    ASSERT_EQ(transport.urls().size(), 1u);
    EXPECT_EQ(transport.urls()[0],
              "http://localhost:9/orgs/org-1/events-stream?limit=2&from=100&to=200");
}

TEST(RetryClient, RecoversAfterOneRateLimit) {
    auto settings = testSettings(3, 2);
    FakeTransport transport;
    transport.respond(429, "").respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(seconds(2)));
    EXPECT_EQ(client.getStats().rateLimited, 1);
    EXPECT_EQ(client.getStats().totalRequests, 2);

    auto lines = messages(progress);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "[429] Rate limited. Waiting 2 seconds (attempt 1/3)");
}

TEST(RetryClient, EmptyBodyOnSuccessIsEmptyPage) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(200, "");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().events.empty());
    EXPECT_FALSE(result.value().nextToken.has_value());
    EXPECT_EQ(client.getStats().totalRequests, 1);

    auto lines = messages(progress);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "[Error] The result of request is empty (attempt 1)");
}

TEST(RetryClient, MalformedJsonOnSuccessIsEmptyPage) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(200, "{\"data\": [");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().events.empty());
}

// ============================================================================
// Rate limiting
// ============================================================================

TEST(RetryClient, AlwaysRateLimitedExhaustsAfterMaxAttempts) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(429, "");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport.urls().size(), 3u);
    EXPECT_EQ(result.error().attempts, 3);
    EXPECT_EQ(result.error().cause, FailureCause::RateLimited);
    EXPECT_EQ(result.error().httpStatus, 429u);

    // base, 2*base, 4*base; the last wait happens before giving up.
    ASSERT_EQ(sleeper.waits.size(), 3u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(1000));
    EXPECT_EQ(sleeper.waits[1], milliseconds(2000));
    EXPECT_EQ(sleeper.waits[2], milliseconds(4000));

    EXPECT_THROW(result.value(), ExhaustedRetries);
}

TEST(RetryClient, RetryAfterHeaderOverridesBackoff) {
    auto settings = testSettings(3, 5);
    FakeTransport transport;
    transport.respond(429, "", std::string("7")).respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    ASSERT_TRUE(client.fetch(firstPage(settings)).ok());

    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(7000));
}

TEST(RetryClient, InvalidRetryAfterFallsBackToBackoff) {
    auto settings = testSettings(3, 5);
    FakeTransport transport;
    transport.respond(429, "", std::string("soon")).respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    ASSERT_TRUE(client.fetch(firstPage(settings)).ok());

    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(5000));
}

TEST(RetryClient, RetryAfterZeroIsHonoured) {
    auto settings = testSettings(2, 5);
    FakeTransport transport;
    transport.respond(429, "", std::string("0")).respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    ASSERT_TRUE(client.fetch(firstPage(settings)).ok());

    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(0));
}

// ============================================================================
// Hard failures
// ============================================================================

TEST(RetryClient, TransportErrorThenSuccess) {
    auto settings = testSettings(3, 3);
    FakeTransport transport;
    transport.fail("connect: Connection refused").respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(3000));
    EXPECT_EQ(client.getStats().totalRetries, 1);

    auto lines = messages(progress);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[Request error] attempt 1: connect: Connection refused");
    EXPECT_EQ(lines[1], "Waiting 3 seconds before retry");
}

TEST(RetryClient, TransportErrorsExhaustWithoutFinalSleep) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.fail("timeout");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport.urls().size(), 3u);
    EXPECT_EQ(result.error().cause, FailureCause::TransportFailure);
    EXPECT_EQ(result.error().httpStatus, 0u);
    EXPECT_NE(result.error().message.find("timeout"), std::string::npos);

    // Waits only between attempts, never after the last one.
    ASSERT_EQ(sleeper.waits.size(), 2u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(1000));
    EXPECT_EQ(sleeper.waits[1], milliseconds(2000));
}

TEST(RetryClient, ServerErrorIsRetriedThenPropagated) {
    auto settings = testSettings(2, 1);
    FakeTransport transport;
    transport.respond(503, "unavailable");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport.urls().size(), 2u);
    EXPECT_EQ(result.error().httpStatus, 503u);
    EXPECT_EQ(result.error().cause, FailureCause::TransportFailure);
    EXPECT_EQ(sleeper.waits.size(), 1u);
}

TEST(RetryClient, ClientErrorIsAHardFailure) {
    auto settings = testSettings(1, 1);
    FakeTransport transport;
    transport.respond(401, "{\"errors\":[]}");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().httpStatus, 401u);
    EXPECT_EQ(result.error().attempts, 1);
    EXPECT_TRUE(sleeper.waits.empty());
}

TEST(RetryClient, RateLimitAndTransportShareOneBudget) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(429, "").fail("reset by peer").respond(429, "");
    ProgressChannel progress;
    RecordingSleeper sleeper;

    RetryClient client(transport, settings, progress, sleeper.fn());
    auto result = client.fetch(firstPage(settings));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport.urls().size(), 3u);
    EXPECT_EQ(result.error().cause, FailureCause::RateLimited);
    ASSERT_EQ(sleeper.waits.size(), 3u);
    EXPECT_EQ(sleeper.waits[2], milliseconds(4000));
}

TEST(RetryClient, AbsolutePageIsFetchedVerbatim) {
    auto settings = testSettings(3, 1);
    FakeTransport transport;
    transport.respond(200, kOkBody);
    ProgressChannel progress;
    RecordingSleeper sleeper;

    const std::string link = "http://other.example.com/orgs/X/events?limit=500&cursor=abc";
    RetryClient client(transport, settings, progress, sleeper.fn());
    ASSERT_TRUE(client.fetch(PageRequest{AbsolutePage{link}}).ok());

    ASSERT_EQ(transport.urls().size(), 1u);
    EXPECT_EQ(transport.urls()[0], link);
}
