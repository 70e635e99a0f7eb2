#include "audit_log.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace audit_collector {

namespace {

nlohmann::ordered_json nullable(const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return *value;
}

std::optional<std::string> readField(const nlohmann::json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

} // namespace

std::string encodeRecordLine(const AuditRecord& record) {
    nlohmann::ordered_json obj;
    obj["time"]        = nullable(record.time);
    obj["action"]      = nullable(record.action);
    obj["actor_name"]  = nullable(record.actorName);
    obj["actor_email"] = nullable(record.actorEmail);
    obj["ip"]          = nullable(record.ip);
    obj["event_id"]    = nullable(record.eventId);

    // UTF-8 passes through unescaped; invalid sequences are replaced.
    return obj.dump(-1, ' ', /*ensure_ascii=*/false,
                    nlohmann::json::error_handler_t::replace);
}

AuditRecord decodeRecordLine(const std::string& line, std::size_t lineNumber) {
    const auto obj = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (obj.is_discarded() || !obj.is_object()) {
        throw CorruptLog("Malformed log line " + std::to_string(lineNumber) +
                         ": not a JSON object", lineNumber);
    }

    AuditRecord rec;
    rec.time       = readField(obj, "time");
    rec.action     = readField(obj, "action");
    rec.actorName  = readField(obj, "actor_name");
    rec.actorEmail = readField(obj, "actor_email");
    rec.ip         = readField(obj, "ip");
    rec.eventId    = readField(obj, "event_id");
    return rec;
}

void appendRecord(const std::string& path, const AuditRecord& record) {
    const std::string line = encodeRecordLine(record);

    std::ofstream out(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open log for append: " + path);
    }
    out << line << '\n';
    out.flush();
    if (!out.good()) {
        throw std::runtime_error("Failed writing to log: " + path);
    }
}

// ---------------------------------------------------------------------------
// AuditLogWriter
// ---------------------------------------------------------------------------

AuditLogWriter::AuditLogWriter(std::string path) : mPath(std::move(path)) {}

void AuditLogWriter::touch() {
    std::ofstream out(mPath, std::ios::out | std::ios::app | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create log: " + mPath);
    }
}

void AuditLogWriter::append(const AuditRecord& record) {
    appendRecord(mPath, record);
    ++mWritten;
}

} // namespace audit_collector
