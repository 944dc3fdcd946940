#include "core/iso8601.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace uuidstamp {
namespace {

using namespace std::chrono;

Result<int64_t> malformed(std::string_view text, std::string_view why) {
    return Result<int64_t>::err(
        Error{"malformed instant '" + std::string(text) + "': " + std::string(why),
              ErrorCode::MalformedInstant});
}

// Reads `width` ASCII digits at `pos`; -1 if any is not a digit.
int read_digits(std::string_view text, size_t pos, size_t width) {
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

std::string format_iso8601(int64_t seconds_since_epoch) {
    const sys_seconds tp{seconds(seconds_since_epoch)};
    const auto date = std::chrono::floor<days>(tp);
    const year_month_day ymd{date};
    const hh_mm_ss<seconds> hms{tp - date};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << hms.hours().count() << ':'
        << std::setw(2) << hms.minutes().count() << ':'
        << std::setw(2) << hms.seconds().count();
    return oss.str();
}

Result<int64_t> parse_iso8601(std::string_view text) {
    if (text.size() != kIsoInstantLength) {
        return malformed(text, "expected YYYY-MM-DDTHH:MM:SS");
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' || text[16] != ':') {
        return malformed(text, "bad separators");
    }

    const int y = read_digits(text, 0, 4);
    const int mo = read_digits(text, 5, 2);
    const int d = read_digits(text, 8, 2);
    const int h = read_digits(text, 11, 2);
    const int mi = read_digits(text, 14, 2);
    const int s = read_digits(text, 17, 2);
    if (y < 0 || mo < 0 || d < 0 || h < 0 || mi < 0 || s < 0) {
        return malformed(text, "non-digit in numeric field");
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return malformed(text, "no such calendar date");
    }
    if (h > 23 || mi > 59 || s > 59) {
        return malformed(text, "time of day out of range");
    }

    const auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
    return Result<int64_t>::ok(static_cast<int64_t>(tp.time_since_epoch().count()));
}

} // namespace uuidstamp
