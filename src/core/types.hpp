#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidstamp {

/// Number of characters in a hyphenated UUID.
inline constexpr size_t kUuidTextLength = 36;

/// Number of hex digits in a UUID once hyphens are removed.
inline constexpr size_t kUuidHexLength = 32;

/// 100-ns ticks between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z.
inline constexpr int64_t kGregorianToUnixTicks = 122192928000000000LL;

/// 100-ns ticks per second.
inline constexpr int64_t kTicksPerSecond = 10000000LL;

/**
 * CandidateUuid - A substring that structurally matches the version-1 UUID
 * pattern, together with its byte offset in the scanned text.
 */
struct CandidateUuid {
    std::string text;
    size_t offset{0};

    bool operator==(const CandidateUuid&) const = default;
};

/**
 * UuidTimeFields - The three hex slices that carry the v1 timestamp.
 *
 * time_high holds only the three digits after the version nibble.
 */
struct UuidTimeFields {
    std::string time_low;   // 8 hex digits
    std::string time_mid;   // 4 hex digits
    std::string time_high;  // 3 hex digits

    /**
     * time_high ++ time_mid ++ time_low (15 hex digits, 60 bits).
     */
    [[nodiscard]] std::string reassembled() const {
        return time_high + time_mid + time_low;
    }

    bool operator==(const UuidTimeFields&) const = default;
};

/**
 * GregorianTimestamp - 100-ns ticks since the UUID epoch (1582-10-15 UTC).
 */
class GregorianTimestamp {
public:
    using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

    constexpr GregorianTimestamp() noexcept : ticks_(0) {}
    explicit constexpr GregorianTimestamp(uint64_t ticks) noexcept
        : ticks_(static_cast<int64_t>(ticks)) {}

    [[nodiscard]] constexpr int64_t ticks() const noexcept {
        return ticks_;
    }

    /**
     * Ticks relative to the Unix epoch. Negative before 1970.
     */
    [[nodiscard]] constexpr Ticks since_unix_epoch() const noexcept {
        return Ticks(ticks_ - kGregorianToUnixTicks);
    }

    auto operator<=>(const GregorianTimestamp&) const = default;

private:
    int64_t ticks_;
};

/**
 * Instant - Whole seconds since the Unix epoch, UTC.
 */
class Instant {
public:
    using Duration = std::chrono::seconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Instant() noexcept : seconds_(0) {}
    explicit constexpr Instant(int64_t seconds) noexcept : seconds_(seconds) {}
    explicit Instant(TimePoint tp) noexcept
        : seconds_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Instant now() {
        return Instant(std::chrono::floor<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t seconds() const noexcept {
        return seconds_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(seconds_));
    }

    auto operator<=>(const Instant&) const = default;

    Instant operator+(Duration d) const {
        return Instant(seconds_ + d.count());
    }

    Instant operator-(Duration d) const {
        return Instant(seconds_ - d.count());
    }

    Duration operator-(const Instant& other) const {
        return Duration(seconds_ - other.seconds_);
    }

private:
    int64_t seconds_;
};

} // namespace uuidstamp
