#include "core/relative_time.hpp"

#include "core/iso8601.hpp"

namespace uuidstamp {
namespace {

constexpr int64_t kSecondsPerMinute = 60;
constexpr int64_t kSecondsPerHour = 3600;
constexpr int64_t kSecondsPerDay = 86400;

std::string plural(int64_t count, std::string_view unit) {
    std::string out = std::to_string(count);
    out += ' ';
    out += unit;
    if (count != 1) out += 's';
    out += " ago";
    return out;
}

} // namespace

RelativeDuration relative_duration(int64_t diff_seconds) noexcept {
    // Unsigned magnitude so INT64_MIN does not overflow.
    const uint64_t diff = diff_seconds < 0
        ? uint64_t{0} - static_cast<uint64_t>(diff_seconds)
        : static_cast<uint64_t>(diff_seconds);

    if (const auto days = diff / kSecondsPerDay; days >= 1) {
        return {RelativeDuration::Unit::Days, static_cast<int64_t>(days)};
    }
    if (const auto hours = diff / kSecondsPerHour; hours >= 1) {
        return {RelativeDuration::Unit::Hours, static_cast<int64_t>(hours)};
    }
    if (const auto minutes = diff / kSecondsPerMinute; minutes >= 1) {
        return {RelativeDuration::Unit::Minutes, static_cast<int64_t>(minutes)};
    }
    return {RelativeDuration::Unit::SubMinute, 0};
}

std::string render(const RelativeDuration& duration) {
    switch (duration.unit) {
        case RelativeDuration::Unit::Days: return plural(duration.count, "day");
        case RelativeDuration::Unit::Hours: return plural(duration.count, "hour");
        case RelativeDuration::Unit::Minutes: return plural(duration.count, "minute");
        case RelativeDuration::Unit::SubMinute: break;
    }
    return "Less than a minute ago";
}

std::string format_relative_seconds(int64_t instant_seconds, Instant now) {
    return render(relative_duration(now.seconds() - instant_seconds));
}

Result<std::string> format_relative(std::string_view instant, Instant now) {
    return parse_iso8601(instant).map([now](int64_t seconds) {
        return format_relative_seconds(seconds, now);
    });
}

} // namespace uuidstamp
