#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace uuidstamp {

/// Length of a `YYYY-MM-DDTHH:MM:SS` string.
inline constexpr size_t kIsoInstantLength = 19;

/**
 * Format seconds since the Unix epoch as `YYYY-MM-DDTHH:MM:SS` (UTC,
 * proleptic Gregorian). Negative values are dates before 1970.
 */
[[nodiscard]] std::string format_iso8601(int64_t seconds_since_epoch);

/**
 * Parse `YYYY-MM-DDTHH:MM:SS` back to seconds since the Unix epoch.
 *
 * Strict: exactly 19 characters, digits where digits belong, month 1-12,
 * a day that exists in that month, hour < 24, minute < 60, second < 60.
 * Fails with ErrorCode::MalformedInstant.
 */
[[nodiscard]] Result<int64_t> parse_iso8601(std::string_view text);

} // namespace uuidstamp
