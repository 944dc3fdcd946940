#include <catch2/catch_test_macros.hpp>

#include "core/relative_time.hpp"
#include "core/iso8601.hpp"

#include <chrono>
#include <cstdint>

using namespace uuidstamp;
using namespace std::chrono_literals;

namespace {

const auto kInstant = "2023-01-16T19:34:41";
const Instant kInstantValue{1673897681};

std::string relative_after(std::chrono::seconds elapsed) {
    return format_relative(kInstant, kInstantValue + elapsed).unwrap();
}

} // namespace

TEST_CASE("format_relative: sub-minute", "[unit][relative]") {
    REQUIRE(relative_after(0s) == "Less than a minute ago");
    REQUIRE(relative_after(59s) == "Less than a minute ago");
}

TEST_CASE("format_relative: minutes", "[unit][relative]") {
    REQUIRE(relative_after(60s) == "1 minute ago");
    REQUIRE(relative_after(90s) == "1 minute ago");
    REQUIRE(relative_after(120s) == "2 minutes ago");
    REQUIRE(relative_after(3599s) == "59 minutes ago");
}

TEST_CASE("format_relative: hours", "[unit][relative]") {
    REQUIRE(relative_after(1h) == "1 hour ago");
    REQUIRE(relative_after(3h) == "3 hours ago");
    REQUIRE(relative_after(23h + 59min) == "23 hours ago");
}

TEST_CASE("format_relative: days take priority over hours", "[unit][relative]") {
    REQUIRE(relative_after(24h) == "1 day ago");
    REQUIRE(relative_after(25h) == "1 day ago");
    REQUIRE(relative_after(48h) == "2 days ago");
    REQUIRE(relative_after(24h * 400) == "400 days ago");
}

TEST_CASE("format_relative: future instants are also 'ago'", "[unit][relative]") {
    REQUIRE(relative_after(-3h) == "3 hours ago");
    REQUIRE(relative_after(3h) == relative_after(-3h));
    REQUIRE(relative_after(-90s) == "1 minute ago");
}

TEST_CASE("format_relative: rejects malformed instants", "[unit][relative]") {
    const auto result = format_relative("yesterday", kInstantValue);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == ErrorCode::MalformedInstant);
}

TEST_CASE("relative_duration: buckets", "[unit][relative]") {
    using Unit = RelativeDuration::Unit;
    REQUIRE(relative_duration(0) == RelativeDuration{Unit::SubMinute, 0});
    REQUIRE(relative_duration(-59) == RelativeDuration{Unit::SubMinute, 0});
    REQUIRE(relative_duration(61) == RelativeDuration{Unit::Minutes, 1});
    REQUIRE(relative_duration(7200) == RelativeDuration{Unit::Hours, 2});
    REQUIRE(relative_duration(-86400 * 3) == RelativeDuration{Unit::Days, 3});
    REQUIRE(relative_duration(INT64_MIN).unit == Unit::Days);
}

TEST_CASE("render: singular and plural", "[unit][relative]") {
    using Unit = RelativeDuration::Unit;
    REQUIRE(render({Unit::Days, 1}) == "1 day ago");
    REQUIRE(render({Unit::Days, 2}) == "2 days ago");
    REQUIRE(render({Unit::Hours, 1}) == "1 hour ago");
    REQUIRE(render({Unit::Minutes, 11}) == "11 minutes ago");
    REQUIRE(render({Unit::SubMinute, 0}) == "Less than a minute ago");
}
