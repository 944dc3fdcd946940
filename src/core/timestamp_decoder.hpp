#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace uuidstamp {

/**
 * Strip hyphens and slice out the timestamp fields.
 *
 * time_low = hex[0:8], time_mid = hex[8:12], time_high = hex[13:16];
 * hex[12] is the version nibble and is dropped. Fails with
 * ErrorCode::MalformedUuid unless exactly 32 hex digits remain.
 * Either case of hex digit is accepted here.
 */
[[nodiscard]] Result<UuidTimeFields> extract_time_fields(std::string_view uuid);

/**
 * Parse time_high ++ time_mid ++ time_low as a 60-bit tick count.
 */
[[nodiscard]] Result<GregorianTimestamp> gregorian_ticks(const UuidTimeFields& fields);

/**
 * (ticks - 122192928000000000) / 10000000, rounded toward negative infinity.
 *
 * Timestamps before the Unix epoch are not rejected; they produce negative
 * seconds.
 */
[[nodiscard]] int64_t to_unix_seconds(GregorianTimestamp ts) noexcept;

/**
 * Seconds since the Unix epoch encoded in a version-1 UUID.
 */
[[nodiscard]] Result<int64_t> decode_seconds(std::string_view uuid);

/**
 * Decode a UUID into its `YYYY-MM-DDTHH:MM:SS` UTC instant.
 */
[[nodiscard]] Result<std::string> decode(std::string_view uuid);

[[nodiscard]] inline Result<std::string> decode(const CandidateUuid& candidate) {
    return decode(std::string_view(candidate.text));
}

} // namespace uuidstamp
