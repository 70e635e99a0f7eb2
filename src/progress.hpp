#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace audit_collector {

enum class ProgressKind {
    Info,
    Warning,     // rate limiting, retry waits
    Error,       // a failed attempt that may still be retried
    Completed,   // terminal: session finished successfully
    Failed,      // terminal: session gave up
};

const char* toString(ProgressKind kind);

/// One human-readable status line pushed by the collection worker.
struct ProgressEvent {
    ProgressKind                          kind = ProgressKind::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string                           message;
    std::optional<std::string>            resultPath;  // set on Completed

    bool isTerminal() const {
        return kind == ProgressKind::Completed || kind == ProgressKind::Failed;
    }
};

/// Unbounded, ordered, thread-safe queue carrying progress from the worker
/// to whoever renders it.  Any number of producers, one consumer.
/// Nothing pushed is ever dropped.
class ProgressChannel {
public:
    void push(ProgressEvent event);

    /// Convenience: stamp @p message with the current time and push it.
    void post(ProgressKind kind, std::string message,
              std::optional<std::string> resultPath = std::nullopt);

    /// Non-blocking: next event, or nullopt if the queue is empty.
    std::optional<ProgressEvent> tryPop();

    /// Block up to @p timeout for the next event.
    std::optional<ProgressEvent> waitPop(std::chrono::milliseconds timeout);

    /// Take everything queued right now, in arrival order.
    std::vector<ProgressEvent> drain();

    std::size_t size() const;

private:
    mutable std::mutex         mMutex;
    std::condition_variable    mNotEmpty;
    std::deque<ProgressEvent>  mQueue;
};

/// "[YYYY-MM-DD HH:MM:SS] message"
std::string renderProgressLine(const ProgressEvent& event);

} // namespace audit_collector
