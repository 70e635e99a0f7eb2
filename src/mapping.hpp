#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace audit_collector {

/// Map a single raw upstream event into the flat record shape.
/// Total: missing or mistyped intermediates yield null for that field only.
AuditRecord normalizeEvent(const nlohmann::json& event);

/// Split a decoded events-stream body into its events and next-page token.
/// A body that is not an object, or whose "data" is not an array, yields an
/// empty page.
PageResponse parseEventsPage(const nlohmann::json& responseBody);

/// Next-page token: "meta.next" first, then "links.next".  Only non-empty
/// strings count.
std::optional<std::string> extractNextToken(const nlohmann::json& responseBody);

/// Build the request for the page after @p page.
/// An absolute-URL token is followed verbatim; any other token becomes the
/// cursor of a copy of @p initial.  nullopt means the stream is exhausted.
std::optional<PageRequest> resolveNext(const PageResponse& page,
                                       const QueryPage& initial);

/// Render a PageRequest into the URL that is actually fetched.
std::string toUrl(const PageRequest& request);

} // namespace audit_collector
