#include "mapping.hpp"
#include "util.hpp"

#include <string>
#include <utility>
#include <vector>

namespace audit_collector {

namespace {

// Member @p key of @p node, or nullptr when node is absent / not an object.
const nlohmann::json* child(const nlohmann::json* node, const char* key) {
    if (node == nullptr || !node->is_object()) return nullptr;
    auto it = node->find(key);
    return it == node->end() ? nullptr : &*it;
}

std::optional<std::string> fieldText(const nlohmann::json* value) {
    if (value == nullptr || value->is_null()) return std::nullopt;
    if (value->is_string()) return value->get<std::string>();
    // Numbers, booleans and nested values keep their JSON rendering.
    return value->dump();
}

std::optional<std::string> nonEmptyString(const nlohmann::json* value) {
    if (value == nullptr || !value->is_string()) return std::nullopt;
    auto s = value->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace

AuditRecord normalizeEvent(const nlohmann::json& event) {
    const auto* attributes = child(&event, "attributes");
    const auto* actor      = child(attributes, "actor");
    const auto* location   = child(attributes, "location");

    AuditRecord rec;
    rec.time       = fieldText(child(attributes, "time"));
    rec.action     = fieldText(child(attributes, "action"));
    rec.actorName  = fieldText(child(actor, "name"));
    rec.actorEmail = fieldText(child(actor, "email"));
    rec.ip         = fieldText(child(location, "ip"));
    rec.eventId    = fieldText(child(&event, "id"));
    return rec;
}

PageResponse parseEventsPage(const nlohmann::json& responseBody) {
    PageResponse page;

    // --- data ---
    const auto* data = child(&responseBody, "data");
    if (data != nullptr && data->is_array()) {
        page.events.assign(data->begin(), data->end());
    }

    // --- cursor ---
    page.nextToken = extractNextToken(responseBody);
    return page;
}

std::optional<std::string> extractNextToken(const nlohmann::json& responseBody) {
    if (auto token = nonEmptyString(child(child(&responseBody, "meta"), "next"))) {
        return token;
    }
    return nonEmptyString(child(child(&responseBody, "links"), "next"));
}

std::optional<PageRequest> resolveNext(const PageResponse& page,
                                       const QueryPage& initial) {
    if (!page.nextToken) return std::nullopt;

    if (isAbsoluteHttpUrl(*page.nextToken)) {
        return PageRequest{AbsolutePage{*page.nextToken}};
    }

    QueryPage next = initial;
    next.cursor    = *page.nextToken;
    return PageRequest{std::move(next)};
}

std::string toUrl(const PageRequest& request) {
    if (const auto* absolute = std::get_if<AbsolutePage>(&request)) {
        return absolute->url;
    }

    const auto& query = std::get<QueryPage>(request);
    std::vector<std::pair<std::string, std::string>> params = {
        {"limit", std::to_string(query.limit)},
        {"from", std::to_string(query.windowStartMs)},
        {"to", std::to_string(query.windowEndMs)},
    };
    if (query.cursor) {
        params.emplace_back("cursor", *query.cursor);
    }

    const char sep = query.baseUrl.find('?') == std::string::npos ? '?' : '&';
    return query.baseUrl + sep + buildQueryString(params);
}

} // namespace audit_collector
