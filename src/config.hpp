#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace audit_collector {

/// Upper bounds for the time-valued settings.
constexpr int kMaxRetryBaseSeconds      = 3600;
constexpr int kMaxRequestTimeoutSeconds = 3600;

/// Resolved, immutable collector settings.  Built once at startup and passed
/// explicitly to whatever needs it.
struct Settings {
    std::string orgId;
    std::string apiToken;
    std::string baseUrl               = "https://api.atlassian.com/admin/v1/orgs";
    int         pageSize              = 500;
    int         maxRetries            = 5;
    int         retryBaseSeconds      = 3;
    int         requestTimeoutSeconds = 30;
    std::string outputDir             = "./logs";

    /// "{baseUrl without trailing '/'}/{orgId}/events-stream"
    std::string eventsEndpoint() const;
};

/// Looks up one configuration key; nullopt when unset.
using ConfigLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Build Settings from @p lookup.
/// @throws ConfigMissing          if ORG_ID or API_TOKEN is absent/empty.
/// @throws std::invalid_argument  on a malformed or out-of-range number
///         (REQUEST_TIMEOUT_SECONDS must be 1..kMaxRequestTimeoutSeconds,
///         RETRY_BASE_SECONDS 0..kMaxRetryBaseSeconds).
Settings loadSettings(const ConfigLookup& lookup);

/// Parse a dotenv file ("KEY=VALUE" lines, '#' comments, optional "export "
/// prefix, optional matching quotes).  A missing file yields an empty map.
std::map<std::string, std::string> parseDotEnvFile(const std::string& path);

/// Parse dotenv text (same rules as parseDotEnvFile).
std::map<std::string, std::string> parseDotEnv(const std::string& text);

/// Process environment first, then the dotenv file at @p dotEnvPath.
Settings loadSettingsFromEnvironment(const std::string& dotEnvPath = ".env");

} // namespace audit_collector
