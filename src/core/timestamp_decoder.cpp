#include "core/timestamp_decoder.hpp"

#include "core/iso8601.hpp"

#include <charconv>
#include <chrono>

namespace uuidstamp {
namespace {

constexpr bool is_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

Error malformed_uuid(std::string_view uuid, std::string_view why) {
    return Error{"malformed uuid '" + std::string(uuid) + "': " + std::string(why),
                 ErrorCode::MalformedUuid};
}

} // namespace

Result<UuidTimeFields> extract_time_fields(std::string_view uuid) {
    std::string hex;
    hex.reserve(kUuidHexLength);
    for (char c : uuid) {
        if (c != '-') hex += c;
    }

    if (hex.size() != kUuidHexLength) {
        return Result<UuidTimeFields>::err(
            malformed_uuid(uuid, "expected 32 hex digits, got " + std::to_string(hex.size())));
    }
    for (char c : hex) {
        if (!is_hex_digit(c)) {
            return Result<UuidTimeFields>::err(malformed_uuid(uuid, "non-hex character"));
        }
    }

    UuidTimeFields fields;
    fields.time_low = hex.substr(0, 8);
    fields.time_mid = hex.substr(8, 4);
    fields.time_high = hex.substr(13, 3);
    return Result<UuidTimeFields>::ok(std::move(fields));
}

Result<GregorianTimestamp> gregorian_ticks(const UuidTimeFields& fields) {
    const auto joined = fields.reassembled();
    uint64_t value = 0;
    const auto* first = joined.data();
    const auto* last = joined.data() + joined.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (joined.empty() || ec != std::errc{} || ptr != last) {
        return Result<GregorianTimestamp>::err(
            Error{"timestamp fields are not hexadecimal: '" + joined + "'", ErrorCode::MalformedUuid});
    }
    if (value >> 60 != 0) {
        return Result<GregorianTimestamp>::err(
            Error{"timestamp exceeds 60 bits: '" + joined + "'", ErrorCode::MalformedUuid});
    }
    return Result<GregorianTimestamp>::ok(GregorianTimestamp(value));
}

int64_t to_unix_seconds(GregorianTimestamp ts) noexcept {
    return std::chrono::floor<std::chrono::seconds>(ts.since_unix_epoch()).count();
}

Result<int64_t> decode_seconds(std::string_view uuid) {
    return extract_time_fields(uuid)
        .and_then(gregorian_ticks)
        .map(to_unix_seconds);
}

Result<std::string> decode(std::string_view uuid) {
    return decode_seconds(uuid).map(format_iso8601);
}

} // namespace uuidstamp
