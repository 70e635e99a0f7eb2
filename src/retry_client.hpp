#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include "progress.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace audit_collector {

/// Position in the retry budget.  attempt is 1-based once a request is made.
struct RetryState {
    int attempt     = 0;
    int maxAttempts = 1;

    bool exhausted() const { return attempt >= maxAttempts; }
};

/// What the last attempt ran into before the budget was spent.
enum class FailureCause {
    RateLimited,
    TransportFailure,
};

const char* toString(FailureCause cause);

struct FetchFailure {
    FailureCause cause      = FailureCause::TransportFailure;
    unsigned int httpStatus = 0;   // 0 when no response was received
    int          attempts   = 0;
    std::string  message;
};

/// Success(PageResponse) | Failure(FetchFailure)
class FetchResult {
public:
    static FetchResult success(PageResponse page);
    static FetchResult failure(FetchFailure failure);

    bool ok() const { return std::holds_alternative<PageResponse>(mValue); }

    /// @throws ExhaustedRetries if this is a failure.
    const PageResponse& value() const;

    /// @throws std::logic_error if this is a success.
    const FetchFailure& error() const;

private:
    explicit FetchResult(std::variant<PageResponse, FetchFailure> value)
        : mValue(std::move(value)) {}

    std::variant<PageResponse, FetchFailure> mValue;
};

/// Blocks the calling thread; injectable so tests can record waits.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Issues one logical events-stream request with bounded retry.
///
/// - 429: always sleeps (Retry-After if it is a plain integer, else
///   base * 2^(attempt-1)), then gives up if the budget is spent.
/// - Transport error / other non-2xx: logged; gives up if the budget is
///   spent, otherwise sleeps base * 2^(attempt-1) and retries.
/// - 2xx with an unparseable body: an empty page, not an error.
///
/// Rate-limit waits and hard failures share one attempt counter.
class RetryClient {
public:
    struct Stats {
        int    totalRequests     = 0;
        int    totalRetries      = 0;
        int    rateLimited       = 0;
        double totalSleepSeconds = 0.0;
    };

    RetryClient(HttpTransport& transport,
                const Settings& settings,
                ProgressChannel& progress,
                Sleeper sleeper = {},
                bool verbose = false);

    FetchResult fetch(const PageRequest& request);

    Stats getStats() const { return mStats; }
    void  resetStats() { mStats = Stats{}; }

private:
    HttpTransport&   mTransport;
    ProgressChannel& mProgress;
    Sleeper          mSleeper;
    int              mMaxAttempts;
    int64_t          mRetryBaseSeconds;
    bool             mVerbose;
    Stats            mStats{};

    void sleepFor(std::chrono::seconds wait);
    FetchResult giveUp(const RetryState& state, FailureCause cause,
                       unsigned int httpStatus, const std::string& message);
};

} // namespace audit_collector
