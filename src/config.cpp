#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace audit_collector {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

int parseIntSetting(const std::string& key, const std::string& value,
                    int minValue, int maxValue) {
    std::size_t used = 0;
    int parsed       = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    if (parsed < minValue || parsed > maxValue) {
        throw std::invalid_argument(key + " must be between " + std::to_string(minValue) +
                                    " and " + std::to_string(maxValue) + ", got " + value);
    }
    return parsed;
}

} // namespace

std::string Settings::eventsEndpoint() const {
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + orgId + "/events-stream";
}

Settings loadSettings(const ConfigLookup& lookup) {
    Settings s;

    auto text = [&](const char* key) -> std::optional<std::string> {
        auto value = lookup(key);
        if (!value) return std::nullopt;
        auto trimmed = trim(*value);
        if (trimmed.empty()) return std::nullopt;
        return trimmed;
    };

    // --- required ---
    std::vector<std::string> missing;
    if (auto v = text("ORG_ID")) s.orgId = *v; else missing.push_back("ORG_ID");
    if (auto v = text("API_TOKEN")) s.apiToken = *v; else missing.push_back("API_TOKEN");

    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) names += " and ";
            names += name;
        }
        throw ConfigMissing(names + " must be set (environment or .env)");
    }

    // --- optional ---
    if (auto v = text("API_BASE_URL")) s.baseUrl = *v;
    constexpr int kIntMax = std::numeric_limits<int>::max();
    if (auto v = text("PAGE_SIZE")) s.pageSize = parseIntSetting("PAGE_SIZE", *v, 1, kIntMax);
    if (auto v = text("MAX_RETRIES"))
        s.maxRetries = parseIntSetting("MAX_RETRIES", *v, 1, kIntMax);
    if (auto v = text("RETRY_BASE_SECONDS"))
        s.retryBaseSeconds = parseIntSetting("RETRY_BASE_SECONDS", *v, 0,
                                             kMaxRetryBaseSeconds);
    if (auto v = text("REQUEST_TIMEOUT_SECONDS"))
        s.requestTimeoutSeconds = parseIntSetting("REQUEST_TIMEOUT_SECONDS", *v, 1,
                                                  kMaxRequestTimeoutSeconds);
    if (auto v = text("LOGS_DIR")) s.outputDir = *v;

    return s;
}

std::map<std::string, std::string> parseDotEnv(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') continue;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        std::string value     = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing " # comment".
            const auto hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        values[key] = value;
    }
    return values;
}

std::map<std::string, std::string> parseDotEnvFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseDotEnv(ss.str());
}

Settings loadSettingsFromEnvironment(const std::string& dotEnvPath) {
    const auto fileValues = parseDotEnvFile(dotEnvPath);

    return loadSettings([&](const std::string& key) -> std::optional<std::string> {
        if (const char* env = std::getenv(key.c_str())) {
            return std::string(env);
        }
        auto it = fileValues.find(key);
        if (it != fileValues.end()) return it->second;
        return std::nullopt;
    });
}

} // namespace audit_collector
