#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uuidstamp {

struct ScanOptions {
    bool time_ago_enabled{true};
    // Fixed offset applied to display_instant only.
    int64_t utc_offset_seconds{0};
};

/**
 * DecodedTimestamp - Everything derived from one matched UUID.
 */
struct DecodedTimestamp {
    int64_t unix_seconds{0};
    std::string instant;          // UTC, YYYY-MM-DDTHH:MM:SS
    std::string display_instant;  // instant shifted by the configured offset
    std::optional<std::string> relative;

    bool operator==(const DecodedTimestamp&) const = default;
};

/**
 * ScanEntry - One candidate and the outcome of decoding it.
 */
struct ScanEntry {
    CandidateUuid candidate;
    Result<DecodedTimestamp> decoded;
};

/**
 * Decode a single UUID string into a DecodedTimestamp.
 */
[[nodiscard]] Result<DecodedTimestamp> decode_timestamp(std::string_view uuid,
                                                        const ScanOptions& options,
                                                        Instant now);

/**
 * Match, decode and (optionally) format every UUID in `text`.
 *
 * A candidate that fails to decode yields an error entry; the remaining
 * candidates are still processed. Entries are in text order.
 */
[[nodiscard]] std::vector<ScanEntry> scan_text(std::string_view text,
                                               const ScanOptions& options,
                                               Instant now);

} // namespace uuidstamp
