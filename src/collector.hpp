#pragma once

#include "config.hpp"
#include "models.hpp"
#include "progress.hpp"
#include "retry_client.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace audit_collector {

/// Drives one collection session: fetch a page, normalize and append every
/// event, resolve the next cursor, repeat until the stream is exhausted or
/// the retry client gives up.
///
/// Pages are strictly sequential; page N+1 is not requested until page N is
/// on disk.  No retry happens here, it all lives in RetryClient.
class Collector {
public:
    enum class State {
        Idle,
        Requesting,
        Persisting,
        Done,
        Failed,
    };

    struct Outcome {
        State              state        = State::Idle;
        std::size_t        totalRecords = 0;
        std::string        logPath;
        std::string        error;        // empty unless Failed
        RetryClient::Stats stats{};
    };

    Collector(RetryClient& client,
              const Settings& settings,
              ProgressChannel& progress,
              bool verbose = false);

    /// Run a session to completion (Done) or terminal failure (Failed).
    /// Progress and the terminal signal go to the channel.
    Outcome run(const CollectionRequest& request);

    State state() const { return mState.load(); }

    /// First request of a session: full window, configured page size, no cursor.
    static QueryPage initialPage(const Settings& settings,
                                 const CollectionRequest& request);

    /// "{outputDir}/{sessionName}.log"
    static std::string logPathFor(const Settings& settings,
                                  const std::string& sessionName);

private:
    RetryClient&       mClient;
    const Settings     mSettings;
    ProgressChannel&   mProgress;
    bool               mVerbose;
    std::atomic<State> mState{State::Idle};

    Outcome fail(Outcome outcome, const std::string& reason);
};

const char* toString(Collector::State state);

} // namespace audit_collector
