#include "progress.hpp"
#include "util.hpp"

#include <iterator>
#include <utility>

namespace audit_collector {

const char* toString(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::Info:      return "info";
        case ProgressKind::Warning:   return "warning";
        case ProgressKind::Error:     return "error";
        case ProgressKind::Completed: return "completed";
        case ProgressKind::Failed:    return "failed";
    }
    return "unknown";
}

void ProgressChannel::push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mQueue.push_back(std::move(event));
    }
    mNotEmpty.notify_one();
}

void ProgressChannel::post(ProgressKind kind, std::string message,
                           std::optional<std::string> resultPath) {
    ProgressEvent event;
    event.kind       = kind;
    event.timestamp  = std::chrono::system_clock::now();
    event.message    = std::move(message);
    event.resultPath = std::move(resultPath);
    push(std::move(event));
}

std::optional<ProgressEvent> ProgressChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mQueue.empty()) return std::nullopt;
    ProgressEvent event = std::move(mQueue.front());
    mQueue.pop_front();
    return event;
}

std::optional<ProgressEvent>
ProgressChannel::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mMutex);
    if (!mNotEmpty.wait_for(lock, timeout, [this]() { return !mQueue.empty(); })) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(mQueue.front());
    mQueue.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<ProgressEvent> out(std::make_move_iterator(mQueue.begin()),
                                   std::make_move_iterator(mQueue.end()));
    mQueue.clear();
    return out;
}

std::size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mQueue.size();
}

std::string renderProgressLine(const ProgressEvent& event) {
    return "[" + formatTimestamp(event.timestamp) + "] " + event.message;
}

} // namespace audit_collector
