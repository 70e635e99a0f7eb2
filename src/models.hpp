#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace audit_collector {

/// One collection run as requested by the caller.
/// windowStartMs <= windowEndMs is the caller's responsibility.
struct CollectionRequest {
    std::string sessionName;
    int64_t     windowStartMs = 0;
    int64_t     windowEndMs   = 0;
};

/// Follow-up link handed back by the API; already carries all query state.
struct AbsolutePage {
    std::string url;
};

/// Events-stream query synthesized from the base URL and window.
struct QueryPage {
    std::string                baseUrl;
    int                        limit         = 0;
    int64_t                    windowStartMs = 0;
    int64_t                    windowEndMs   = 0;
    std::optional<std::string> cursor;
};

/// Exactly one representation is active; they are never merged.
using PageRequest = std::variant<AbsolutePage, QueryPage>;

/// Decoded events-stream page.
struct PageResponse {
    std::vector<nlohmann::json> events;     // raw upstream events, in order
    std::optional<std::string>  nextToken;  // cursor or absolute URL
};

/// Flat persisted shape of one audit event.  Every field is nullable.
struct AuditRecord {
    std::optional<std::string> time;
    std::optional<std::string> action;
    std::optional<std::string> actorName;
    std::optional<std::string> actorEmail;
    std::optional<std::string> ip;
    std::optional<std::string> eventId;

    bool operator==(const AuditRecord& other) const {
        return time == other.time && action == other.action &&
               actorName == other.actorName &&
               actorEmail == other.actorEmail && ip == other.ip &&
               eventId == other.eventId;
    }
    bool operator!=(const AuditRecord& other) const { return !(*this == other); }
};

/// Column names shared by the log line encoding and the CSV export.
inline const std::vector<std::string> kRecordFields = {
    "time", "action", "actor_name", "actor_email", "ip", "event_id"};

} // namespace audit_collector
