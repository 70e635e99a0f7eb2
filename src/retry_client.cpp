#include "retry_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace audit_collector {

const char* toString(FailureCause cause) {
    switch (cause) {
        case FailureCause::RateLimited:      return "rate limited";
        case FailureCause::TransportFailure: return "transport failure";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// FetchResult
// ---------------------------------------------------------------------------

FetchResult FetchResult::success(PageResponse page) {
    return FetchResult(std::move(page));
}

FetchResult FetchResult::failure(FetchFailure failure) {
    return FetchResult(std::move(failure));
}

const PageResponse& FetchResult::value() const {
    if (const auto* failure = std::get_if<FetchFailure>(&mValue)) {
        throw ExhaustedRetries(failure->message, failure->attempts);
    }
    return std::get<PageResponse>(mValue);
}

const FetchFailure& FetchResult::error() const {
    if (ok()) {
        throw std::logic_error("FetchResult::error() called on a success");
    }
    return std::get<FetchFailure>(mValue);
}

// ---------------------------------------------------------------------------
// RetryClient
// ---------------------------------------------------------------------------

RetryClient::RetryClient(HttpTransport& transport,
                         const Settings& settings,
                         ProgressChannel& progress,
                         Sleeper sleeper,
                         bool verbose)
    : mTransport(transport)
    , mProgress(progress)
    , mSleeper(std::move(sleeper))
    , mMaxAttempts(settings.maxRetries)
    , mRetryBaseSeconds(settings.retryBaseSeconds)
    , mVerbose(verbose)
{
    if (!mSleeper) {
        mSleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

FetchResult RetryClient::fetch(const PageRequest& request)
{
    const std::string url = toUrl(request);
    RetryState state{0, mMaxAttempts};

    while (true) {
        ++state.attempt;
        ++mStats.totalRequests;
        const auto backoff = computeBackoff(state.attempt, mRetryBaseSeconds);

        HttpResponse resp;
        try {
            resp = mTransport.get(url);
        } catch (const std::exception& e) {
            // Network / timeout / TLS: hard failure.
            const std::string what = e.what();
            mProgress.post(ProgressKind::Error,
                           "[Request error] attempt " + std::to_string(state.attempt) +
                           ": " + what);
            if (mVerbose) {
                std::cerr << "[RetryClient] Network error: " << what << " (attempt "
                          << state.attempt << "/" << state.maxAttempts << ")\n";
            }

            if (state.exhausted()) {
                return giveUp(state, FailureCause::TransportFailure, 0, what);
            }

            mProgress.post(ProgressKind::Warning,
                           "Waiting " + std::to_string(backoff.count()) +
                           " seconds before retry");
            sleepFor(backoff);
            ++mStats.totalRetries;
            continue;
        }

        if (resp.httpStatus == 429) {
            // Soft failure: always wait before deciding.
            ++mStats.rateLimited;
            std::chrono::seconds wait = backoff;
            if (resp.retryAfter) {
                if (auto advised = parseRetryAfter(*resp.retryAfter)) wait = *advised;
            }

            mProgress.post(ProgressKind::Warning,
                           "[429] Rate limited. Waiting " + std::to_string(wait.count()) +
                           " seconds (attempt " + std::to_string(state.attempt) + "/" +
                           std::to_string(state.maxAttempts) + ")");
            sleepFor(wait);

            if (state.exhausted()) {
                return giveUp(state, FailureCause::RateLimited, resp.httpStatus,
                              "HTTP 429 Too Many Requests for url: " + url);
            }
            ++mStats.totalRetries;
            continue;
        }

        if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
            const std::string what = "HTTP " + std::to_string(resp.httpStatus) +
                                     " for url: " + url;
            mProgress.post(ProgressKind::Error,
                           "[Request error] attempt " + std::to_string(state.attempt) +
                           ": " + what);

            if (state.exhausted()) {
                return giveUp(state, FailureCause::TransportFailure, resp.httpStatus, what);
            }

            mProgress.post(ProgressKind::Warning,
                           "Waiting " + std::to_string(backoff.count()) +
                           " seconds before retry");
            sleepFor(backoff);
            ++mStats.totalRetries;
            continue;
        }

        // Some rate-limit responses come back as 2xx with no body.
        const auto body = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
        if (body.is_discarded() || !body.is_object()) {
            mProgress.post(ProgressKind::Error,
                           "[Error] The result of request is empty (attempt " +
                           std::to_string(state.attempt) + ")");
            return FetchResult::success(PageResponse{});
        }

        if (mVerbose) {
            std::cerr << "[RetryClient] HTTP " << resp.httpStatus << " after "
                      << state.attempt << " attempt(s)\n";
        }
        return FetchResult::success(parseEventsPage(body));
    }
}

void RetryClient::sleepFor(std::chrono::seconds wait)
{
    mStats.totalSleepSeconds += static_cast<double>(wait.count());
    mSleeper(std::chrono::duration_cast<std::chrono::milliseconds>(wait));
}

FetchResult RetryClient::giveUp(const RetryState& state, FailureCause cause,
                                unsigned int httpStatus, const std::string& message)
{
    if (mVerbose) {
        std::cerr << "[RetryClient] Max retries exceeded after " << state.attempt
                  << " attempt(s): " << message << "\n";
    }

    FetchFailure failure;
    failure.cause      = cause;
    failure.httpStatus = httpStatus;
    failure.attempts   = state.attempt;
    failure.message    = "Max retries exceeded after " + std::to_string(state.attempt) +
                         " attempt(s) (" + toString(cause) + "): " + message;
    return FetchResult::failure(std::move(failure));
}

} // namespace audit_collector
