#include "csv_export.hpp"
#include "audit_log.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace audit_collector {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRowEnd = "\r\n";

// Removes the staging file unless the export committed it.
class StagingFile {
public:
    explicit StagingFile(fs::path path) : mPath(std::move(path)) {}
    ~StagingFile() {
        if (!mCommitted) {
            std::error_code ec;
            fs::remove(mPath, ec);
        }
    }
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    const fs::path& path() const { return mPath; }

    void commitTo(const fs::path& target) {
        fs::rename(mPath, target);
        mCommitted = true;
    }

private:
    fs::path mPath;
    bool     mCommitted = false;
};

std::string cell(const std::optional<std::string>& value) {
    return value ? csvEscape(*value) : std::string();
}

} // namespace

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string toCsvRow(const AuditRecord& record) {
    return cell(record.time) + "," + cell(record.action) + "," +
           cell(record.actorName) + "," + cell(record.actorEmail) + "," +
           cell(record.ip) + "," + cell(record.eventId);
}

std::size_t exportLogToCsv(const std::string& logPath, const std::string& csvPath) {
    std::ifstream in(logPath, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open log for export: " + logPath);
    }

    StagingFile staging(fs::path(csvPath + ".tmp"));
    std::size_t rows = 0;
    {
        std::ofstream out(staging.path(), std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open CSV for writing: " +
                                     staging.path().string());
        }

        // --- header ---
        for (std::size_t i = 0; i < kRecordFields.size(); ++i) {
            if (i > 0) out << ',';
            out << kRecordFields[i];
        }
        out << kRowEnd;

        // --- rows ---
        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            if (!line.empty() && line.back() == '\r') line.pop_back();

            const AuditRecord rec = decodeRecordLine(line, lineNumber);
            out << toCsvRow(rec) << kRowEnd;
            ++rows;
        }

        if (in.bad()) {
            throw std::runtime_error("Failed reading log: " + logPath);
        }
        out.flush();
        if (!out.good()) {
            throw std::runtime_error("Failed writing CSV: " + staging.path().string());
        }
    }

    staging.commitTo(fs::path(csvPath));
    return rows;
}

} // namespace audit_collector
