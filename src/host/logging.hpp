#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(uuidstampScanLog)
Q_DECLARE_LOGGING_CATEGORY(uuidstampCliLog)

namespace uuidstamp::host {

// Installs a Qt message handler that stamps time/level/category, appends to
// `path` (or default_log_file_path() when empty) and echoes warnings and
// above to stderr.
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on debug output for every uuidstamp.* category.
void enable_debug_logging();

} // namespace uuidstamp::host
