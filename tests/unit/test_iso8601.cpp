#include <catch2/catch_test_macros.hpp>

#include "core/iso8601.hpp"

using namespace uuidstamp;

TEST_CASE("format_iso8601: formats UTC seconds", "[unit][iso8601]") {
    REQUIRE(format_iso8601(0) == "1970-01-01T00:00:00");
    REQUIRE(format_iso8601(1673897681) == "2023-01-16T19:34:41");
    REQUIRE(format_iso8601(951782400) == "2000-02-29T00:00:00");
}

TEST_CASE("format_iso8601: handles dates before 1970", "[unit][iso8601]") {
    REQUIRE(format_iso8601(-1) == "1969-12-31T23:59:59");
    REQUIRE(format_iso8601(-12219292800LL) == "1582-10-15T00:00:00");
}

TEST_CASE("parse_iso8601: inverts format_iso8601", "[unit][iso8601]") {
    REQUIRE(parse_iso8601("1970-01-01T00:00:00").unwrap() == 0);
    REQUIRE(parse_iso8601("2023-01-16T19:34:41").unwrap() == 1673897681);
    REQUIRE(parse_iso8601("1969-12-31T23:59:59").unwrap() == -1);
    REQUIRE(parse_iso8601("1582-10-15T00:00:00").unwrap() == -12219292800LL);
}

TEST_CASE("parse_iso8601: rejects anything but the exact layout", "[unit][iso8601]") {
    const char* bad[] = {
        "",
        "2023-01-16",
        "2023-01-16 19:34:41",
        "2023-01-16T19:34:41Z",
        "2023-01-16T19:34:41.000",
        "2023/01/16T19:34:41",
        "2023-1-16T19:34:41 ",
        "20a3-01-16T19:34:41",
        "2023-13-01T00:00:00",
        "2023-00-01T00:00:00",
        "2023-02-29T00:00:00",
        "2023-04-31T00:00:00",
        "2023-01-16T24:00:00",
        "2023-01-16T23:60:00",
        "2023-01-16T23:59:60",
    };
    for (const auto* input : bad) {
        INFO(input);
        const auto result = parse_iso8601(input);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::MalformedInstant);
    }
}

TEST_CASE("parse_iso8601: accepts leap days", "[unit][iso8601]") {
    REQUIRE(parse_iso8601("2024-02-29T12:00:00").is_ok());
    REQUIRE(parse_iso8601("2000-02-29T00:00:00").unwrap() == 951782400);
}
