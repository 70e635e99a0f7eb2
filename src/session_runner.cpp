#include "session_runner.hpp"

#include <exception>
#include <string>
#include <utility>

namespace audit_collector {

SessionRunner::SessionRunner(Collector& collector, ProgressChannel& progress,
                             Launcher launcher)
    : mCollector(collector)
    , mProgress(progress)
    , mLauncher(std::move(launcher))
{
    if (!mLauncher) {
        mLauncher = [](std::function<void()> body) { return std::thread(std::move(body)); };
    }
}

SessionRunner::~SessionRunner() {
    if (mWorker.joinable()) {
        mWorker.join();
    }
}

bool SessionRunner::start(const CollectionRequest& request) {
    bool expected = false;
    if (!mActive.compare_exchange_strong(expected, true)) {
        return false;
    }

    // The previous worker has already finished; reclaim it.
    if (mWorker.joinable()) {
        mWorker.join();
    }

    mProgress.post(ProgressKind::Info, "Background collection started.");
    try {
        mWorker = mLauncher([this, request]() { work(request); });
    } catch (const std::exception& e) {
        mActive = false;
        mProgress.post(ProgressKind::Failed,
                       std::string("[Error] Collection failed: could not start worker: ") +
                       e.what());
        throw;
    }
    return true;
}

std::optional<Collector::Outcome> SessionRunner::wait() {
    if (mWorker.joinable()) {
        mWorker.join();
    }
    return lastOutcome();
}

std::optional<Collector::Outcome> SessionRunner::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mLastOutcome;
}

void SessionRunner::work(CollectionRequest request) {
    Collector::Outcome outcome;
    try {
        outcome = mCollector.run(request);
    } catch (const std::exception& e) {
        // Collector::run reports its own failures; this covers what escapes it.
        outcome.state = Collector::State::Failed;
        outcome.error = e.what();
        mProgress.post(ProgressKind::Failed,
                       std::string("[Error] Collection failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mMutex);
        mLastOutcome = std::move(outcome);
    }
    mActive = false;
}

} // namespace audit_collector
