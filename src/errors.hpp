#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace audit_collector {

/// Required settings are absent.  Fatal at startup.
class ConfigMissing : public std::runtime_error {
public:
    explicit ConfigMissing(const std::string& what) : std::runtime_error(what) {}
};

/// Connection, timeout or unexpected HTTP status on a single attempt.
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string& what, unsigned int httpStatus = 0)
        : std::runtime_error(what), mHttpStatus(httpStatus) {}

    /// 0 when no HTTP response was received.
    unsigned int httpStatus() const { return mHttpStatus; }

private:
    unsigned int mHttpStatus;
};

/// The retry budget was spent without a usable response.
class ExhaustedRetries : public std::runtime_error {
public:
    ExhaustedRetries(const std::string& what, int attempts)
        : std::runtime_error(what), mAttempts(attempts) {}

    int attempts() const { return mAttempts; }

private:
    int mAttempts;
};

/// A session log line could not be decoded during export.
class CorruptLog : public std::runtime_error {
public:
    CorruptLog(const std::string& what, std::size_t lineNumber)
        : std::runtime_error(what), mLineNumber(lineNumber) {}

    /// 1-based line number of the offending line.
    std::size_t lineNumber() const { return mLineNumber; }

private:
    std::size_t mLineNumber;
};

} // namespace audit_collector
