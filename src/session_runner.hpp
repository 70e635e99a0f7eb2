#pragma once

#include "collector.hpp"
#include "models.hpp"
#include "progress.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace audit_collector {

/// Runs a Collector on its own thread so network waits never block the
/// caller.  At most one session is in flight; there is no mid-flight
/// cancellation.
class SessionRunner {
public:
    /// Starts the worker thread; injectable so tests can simulate a failed
    /// thread creation.
    using Launcher = std::function<std::thread(std::function<void()>)>;

    SessionRunner(Collector& collector, ProgressChannel& progress,
                  Launcher launcher = {});
    ~SessionRunner();

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    /// Start a session.  Returns false (and starts nothing) while another
    /// session is still running.
    /// @throws std::system_error if the worker thread cannot be created; the
    ///         runner stays idle and may be started again.
    bool start(const CollectionRequest& request);

    bool isActive() const { return mActive.load(); }

    /// Block until the current session (if any) ends; returns its outcome.
    std::optional<Collector::Outcome> wait();

    /// Outcome of the most recently finished session.
    std::optional<Collector::Outcome> lastOutcome() const;

private:
    Collector&        mCollector;
    ProgressChannel&  mProgress;
    Launcher          mLauncher;
    std::thread       mWorker;
    std::atomic<bool> mActive{false};

    mutable std::mutex                mMutex;
    std::optional<Collector::Outcome> mLastOutcome;

    void work(CollectionRequest request);
};

} // namespace audit_collector
