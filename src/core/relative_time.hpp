#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace uuidstamp {

/**
 * RelativeDuration - An absolute elapsed time bucketed into one unit.
 */
struct RelativeDuration {
    enum class Unit {
        Days,
        Hours,
        Minutes,
        SubMinute
    };

    Unit unit{Unit::SubMinute};
    int64_t count{0};

    bool operator==(const RelativeDuration&) const = default;
};

/**
 * Bucket an elapsed number of seconds. The sign is ignored.
 *
 * Buckets are tried largest first: 25 hours is "1 day", not "25 hours".
 */
[[nodiscard]] RelativeDuration relative_duration(int64_t diff_seconds) noexcept;

/**
 * "1 day ago", "3 hours ago", "Less than a minute ago", ...
 */
[[nodiscard]] std::string render(const RelativeDuration& duration);

/**
 * Relative time between a `YYYY-MM-DDTHH:MM:SS` instant and `now`.
 *
 * Instants in the future are also rendered with "ago". Fails with
 * ErrorCode::MalformedInstant when `instant` does not parse.
 */
[[nodiscard]] Result<std::string> format_relative(std::string_view instant, Instant now);

/**
 * Same as format_relative() for an already-decoded instant.
 */
[[nodiscard]] std::string format_relative_seconds(int64_t instant_seconds, Instant now);

} // namespace uuidstamp
