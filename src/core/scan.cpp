#include "core/scan.hpp"

#include "core/iso8601.hpp"
#include "core/relative_time.hpp"
#include "core/timestamp_decoder.hpp"
#include "core/uuid_matcher.hpp"

namespace uuidstamp {

Result<DecodedTimestamp> decode_timestamp(std::string_view uuid,
                                          const ScanOptions& options,
                                          Instant now) {
    return decode_seconds(uuid).map([&](int64_t seconds) {
        DecodedTimestamp out;
        out.unix_seconds = seconds;
        out.instant = format_iso8601(seconds);
        out.display_instant = options.utc_offset_seconds == 0
            ? out.instant
            : format_iso8601(seconds + options.utc_offset_seconds);
        if (options.time_ago_enabled) {
            out.relative = format_relative_seconds(seconds, now);
        }
        return out;
    });
}

std::vector<ScanEntry> scan_text(std::string_view text,
                                 const ScanOptions& options,
                                 Instant now) {
    std::vector<ScanEntry> entries;
    for (const auto& candidate : find_all(text)) {
        entries.push_back(ScanEntry{candidate, decode_timestamp(candidate.text, options, now)});
    }
    return entries;
}

} // namespace uuidstamp
