#pragma once

#include "models.hpp"

#include <cstddef>
#include <string>

namespace audit_collector {

/// Quote a CSV field only when it contains ',', '"', CR or LF.
std::string csvEscape(const std::string& field);

/// One CSV row (no terminator) in kRecordFields order; null renders empty.
std::string toCsvRow(const AuditRecord& record);

/// Re-render a session log as CSV with a header row.
///
/// Output is staged in "<csvPath>.tmp" and renamed into place only once every
/// line has been decoded, so a failed export never leaves a truncated table.
///
/// @returns number of data rows written.
/// @throws CorruptLog          on the first malformed line.
/// @throws std::runtime_error  if either file cannot be opened or written.
std::size_t exportLogToCsv(const std::string& logPath, const std::string& csvPath);

} // namespace audit_collector
