#pragma once

#include <QString>
#include <QStringList>

#include <string_view>
#include <vector>

#include "core/scan.hpp"
#include "core/result.hpp"
#include "host/settings.hpp"

namespace uuidstamp::host {

struct ScanReport {
    QString out;  // stdout
    QString err;  // stderr
    int failures = 0;
};

// Matches found in one input. `file` is empty for stdin.
struct ScanSource {
    QString file;
    std::vector<ScanEntry> entries;
};

// Scans one input on its own; offsets are relative to `text`.
[[nodiscard]] ScanSource scan_source(QString file, std::string_view text,
                                     const ScanOptions& options, Instant now);

// Text output: one line per match,
//   [<file>\t]<offset>\t<uuid>\t<instant>[\t<relative>]
// with failed candidates listed on `err` as
//   [<file>\t]<offset>\t<uuid>\terror: <message>
// The file column is present only for named files.
[[nodiscard]] ScanReport format_scan_report(const std::vector<ScanSource>& sources);
[[nodiscard]] ScanReport format_scan_report(const std::vector<ScanEntry>& entries);

// JSON output:
// {
//   "matches": [{ "file"?, "offset", "uuid", "instant"?, "relative"?, "error"? }]
// }
[[nodiscard]] ScanReport format_scan_report_json(const std::vector<ScanSource>& sources);
[[nodiscard]] ScanReport format_scan_report_json(const std::vector<ScanEntry>& entries);

// Reports for `decode`. Text lines drop the position column
//   <uuid>\t<instant>[\t<relative>]
// and JSON objects carry the argument position as "index".
[[nodiscard]] ScanReport format_decode_report(const std::vector<ScanEntry>& entries);
[[nodiscard]] ScanReport format_decode_report_json(const std::vector<ScanEntry>& entries);

// Overrides given on the command line; unset fields keep the stored settings.
struct CliOverrides {
    bool noTimeAgo = false;
    bool local = false;
    QString utcOffsetMinutes;
    QString now;
};

struct ResolvedCliOptions {
    ScanOptions scan;
    Instant now;
};

[[nodiscard]] Result<ResolvedCliOptions> resolve_cli_options(const DisplaySettings& stored,
                                                             const CliOverrides& overrides);

// Entries for `decode <uuid>...`: each argument is decoded as given, without
// running the matcher, so malformed input is reported rather than ignored.
// The candidate's offset holds the argument index.
[[nodiscard]] std::vector<ScanEntry> decode_arguments(const QStringList& uuids,
                                                      const ScanOptions& options,
                                                      Instant now);

} // namespace uuidstamp::host
