#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "core/iso8601.hpp"
#include "core/timestamp_decoder.hpp"
#include "core/uuid_matcher.hpp"

#include <cstdio>
#include <ctime>
#include <string>

using namespace uuidstamp;

namespace {

struct V1Uuid {
    uint64_t ticks;
    std::string text;
};

// Lays out a 60-bit tick count the way RFC 4122 places it in a v1 UUID.
std::string v1_text(uint64_t ticks, unsigned variant_nibble, uint16_t clock_low, uint64_t node) {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-1%03llx-%x%03x-%012llx",
                  static_cast<unsigned long long>(ticks & 0xffffffffULL),
                  static_cast<unsigned long long>((ticks >> 32) & 0xffffULL),
                  static_cast<unsigned long long>((ticks >> 48) & 0xfffULL),
                  variant_nibble, clock_low & 0xfffu,
                  static_cast<unsigned long long>(node & 0xffffffffffffULL));
    return std::string(buf);
}

// Independent calendar conversion through the C library.
std::string reference_iso(int64_t seconds) {
    const auto t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

int64_t floor_div(int64_t a, int64_t b) {
    const auto q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

} // namespace

namespace rc {

template<>
struct Arbitrary<V1Uuid> {
    static Gen<V1Uuid> arbitrary() {
        return gen::apply(
            [](uint64_t ticks, unsigned variant, uint16_t clock_low, uint64_t node) {
                const auto t = ticks & ((uint64_t{1} << 60) - 1);
                return V1Uuid{t, v1_text(t, 8 + variant, clock_low, node)};
            },
            gen::arbitrary<uint64_t>(),
            gen::inRange(0u, 4u),
            gen::arbitrary<uint16_t>(),
            gen::arbitrary<uint64_t>());
    }
};

} // namespace rc

TEST_CASE("Property: generated v1 uuids match the pattern", "[property][decoder]") {
    rc::check("matches_v1_pattern(v1 layout)",
        [](const V1Uuid& u) {
            RC_ASSERT(matches_v1_pattern(u.text));
            const auto matches = find_all(" " + u.text + " ").collect();
            RC_ASSERT(matches.size() == 1u);
            RC_ASSERT(matches[0].offset == 1u);
        }
    );
}

TEST_CASE("Property: decode_seconds equals the fixed-constant formula", "[property][decoder]") {
    rc::check("decode_seconds(u) == floor((ticks - 122192928000000000) / 10^7)",
        [](const V1Uuid& u) {
            const auto expected = floor_div(static_cast<int64_t>(u.ticks) - kGregorianToUnixTicks,
                                            kTicksPerSecond);
            RC_ASSERT(decode_seconds(u.text).unwrap() == expected);
        }
    );
}

TEST_CASE("Property: decode agrees with an independent calendar conversion", "[property][decoder]") {
    rc::check("decode(u) == strftime(gmtime(seconds))",
        [](const V1Uuid& u) {
            const auto seconds = decode_seconds(u.text).unwrap();
            RC_ASSERT(decode(u.text).unwrap() == reference_iso(seconds));
        }
    );
}

TEST_CASE("Property: iso8601 round-trips decoded instants", "[property][iso8601]") {
    rc::check("parse(format(seconds)) == seconds",
        [](const V1Uuid& u) {
            const auto seconds = decode_seconds(u.text).unwrap();
            RC_ASSERT(parse_iso8601(format_iso8601(seconds)).unwrap() == seconds);
        }
    );
}

TEST_CASE("Property: decode never throws on arbitrary strings", "[property][decoder]") {
    rc::check("decode(s) is ok or MalformedUuid",
        [](const std::string& s) {
            const auto result = decode(s);
            if (result.is_err()) {
                RC_ASSERT(result.unwrap_err().code == ErrorCode::MalformedUuid);
            }
        }
    );
}
