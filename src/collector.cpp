#include "collector.hpp"
#include "audit_log.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace audit_collector {

const char* toString(Collector::State state) {
    switch (state) {
        case Collector::State::Idle:       return "idle";
        case Collector::State::Requesting: return "requesting";
        case Collector::State::Persisting: return "persisting";
        case Collector::State::Done:       return "done";
        case Collector::State::Failed:     return "failed";
    }
    return "unknown";
}

Collector::Collector(RetryClient& client,
                     const Settings& settings,
                     ProgressChannel& progress,
                     bool verbose)
    : mClient(client)
    , mSettings(settings)
    , mProgress(progress)
    , mVerbose(verbose) {}

QueryPage Collector::initialPage(const Settings& settings,
                                 const CollectionRequest& request)
{
    QueryPage page;
    page.baseUrl       = settings.eventsEndpoint();
    page.limit         = settings.pageSize;
    page.windowStartMs = request.windowStartMs;
    page.windowEndMs   = request.windowEndMs;
    return page;
}

std::string Collector::logPathFor(const Settings& settings,
                                  const std::string& sessionName)
{
    return (std::filesystem::path(settings.outputDir) / (sessionName + ".log")).string();
}

// ---------------------------------------------------------------------------
// Session loop
// ---------------------------------------------------------------------------

Collector::Outcome Collector::run(const CollectionRequest& request)
{
    mState = State::Idle;
    mClient.resetStats();

    Outcome outcome;
    outcome.logPath = logPathFor(mSettings, request.sessionName);

    const QueryPage initial = initialPage(mSettings, request);
    PageRequest     pageRequest{initial};
    AuditLogWriter  writer(outcome.logPath);
    bool            logCreated = false;

    mProgress.post(ProgressKind::Info,
                   "Started: " + formatIsoTimestamp(std::chrono::system_clock::now()) +
                   " | file: " + outcome.logPath +
                   " | limit=" + std::to_string(mSettings.pageSize));

    try {
        std::filesystem::create_directories(mSettings.outputDir);

        while (true) {
            // --- Requesting ---
            mState = State::Requesting;
            const std::string url = toUrl(pageRequest);
            mProgress.post(ProgressKind::Info, "Request: " + url);
            if (mVerbose) {
                std::cerr << "[Collector] Fetching " << url << "\n";
            }

            const FetchResult result = mClient.fetch(pageRequest);
            if (!result.ok()) {
                outcome.stats = mClient.getStats();
                return fail(std::move(outcome), result.error().message);
            }
            const PageResponse& page = result.value();

            // --- Persisting ---
            mState = State::Persisting;
            mProgress.post(ProgressKind::Info,
                           "Received: " + std::to_string(page.events.size()) + " events");

            if (!logCreated) {
                writer.touch();
                logCreated = true;
            }
            for (const auto& event : page.events) {
                writer.append(normalizeEvent(event));
                ++outcome.totalRecords;
            }

            if (mVerbose) {
                std::cerr << "[Collector] Appended " << page.events.size()
                          << " records (total so far: " << outcome.totalRecords << ")\n";
            }

            // --- advance cursor ---
            auto next = resolveNext(page, initial);
            if (!next) {
                mProgress.post(ProgressKind::Info,
                               "No next token: collection complete");
                break;
            }
            pageRequest = std::move(*next);
        }
    } catch (const std::exception& e) {
        // Log I/O or directory failures end the session; earlier lines stay.
        outcome.stats = mClient.getStats();
        return fail(std::move(outcome), e.what());
    }

    outcome.stats = mClient.getStats();
    outcome.state = State::Done;
    mState        = State::Done;

    mProgress.post(ProgressKind::Info,
                   "Collection complete: " + std::to_string(outcome.totalRecords) +
                   " events saved.");
    mProgress.post(ProgressKind::Completed, "Result file: " + outcome.logPath,
                   outcome.logPath);
    return outcome;
}

Collector::Outcome Collector::fail(Outcome outcome, const std::string& reason)
{
    outcome.state = State::Failed;
    outcome.error = reason;
    mState        = State::Failed;

    if (mVerbose) {
        std::cerr << "[Collector] Session failed after " << outcome.totalRecords
                  << " records: " << reason << "\n";
    }
    mProgress.post(ProgressKind::Failed, "[Error] Collection failed: " + reason);
    return outcome;
}

} // namespace audit_collector
