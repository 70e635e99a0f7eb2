#pragma once

#include "models.hpp"

#include <cstddef>
#include <string>

namespace audit_collector {

/// One self-contained JSON object, fields in kRecordFields order, absent
/// fields as null.  No trailing newline.
std::string encodeRecordLine(const AuditRecord& record);

/// Decode one log line.  Missing keys become null.
/// @throws CorruptLog if the line is not a JSON object.
AuditRecord decodeRecordLine(const std::string& line, std::size_t lineNumber = 0);

/// Open @p path for append (creating it if absent), write one line, flush.
/// @throws std::runtime_error on I/O failure.
void appendRecord(const std::string& path, const AuditRecord& record);

/// Append-only writer for one session's log file.  Single writer per path.
class AuditLogWriter {
public:
    explicit AuditLogWriter(std::string path);

    /// Create the file if it does not exist yet; existing content is kept.
    void touch();

    void append(const AuditRecord& record);

    const std::string& path() const { return mPath; }
    std::size_t recordsWritten() const { return mWritten; }

private:
    std::string mPath;
    std::size_t mWritten = 0;
};

} // namespace audit_collector
