#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <chrono>

using namespace vaultstream;
using namespace std::chrono;

// ============================================================================
// Timestamps
// ============================================================================

TEST_CASE("format_timestamp writes UTC with milliseconds", "[utils][time]") {
    const auto tp = sys_days{year{2024} / 3 / 5} + hours(7) + minutes(8) + seconds(9) + milliseconds(42);
    CHECK(utils::format_timestamp(time_point_cast<system_clock::duration>(tp)) ==
          "2024-03-05T07:08:09.042Z");
}

TEST_CASE("parse_timestamp reads back what format_timestamp writes", "[utils][time]") {
    const auto now = time_point_cast<milliseconds>(system_clock::now());
    auto parsed = utils::parse_timestamp(utils::format_timestamp(now));
    REQUIRE(parsed.has_value());
    CHECK(time_point_cast<milliseconds>(*parsed) == now);
}

TEST_CASE("parse_timestamp accepts the common ISO-8601 variants", "[utils][time]") {
    const auto expected = sys_days{year{2023} / 12 / 31} + hours(23) + minutes(0) + seconds(0);

    auto naive = utils::parse_timestamp("2023-12-31T23:00:00");
    REQUIRE(naive.has_value());
    CHECK(*naive == expected);

    auto micro = utils::parse_timestamp("2023-12-31T23:00:00.500000");
    REQUIRE(micro.has_value());
    CHECK(*micro == expected + milliseconds(500));

    auto zulu = utils::parse_timestamp("2023-12-31T23:00:00Z");
    REQUIRE(zulu.has_value());
    CHECK(*zulu == expected);

    auto offset = utils::parse_timestamp("2024-01-01T01:00:00+02:00");
    REQUIRE(offset.has_value());
    CHECK(*offset == expected);
}

TEST_CASE("parse_timestamp rejects malformed input", "[utils][time]") {
    CHECK_FALSE(utils::parse_timestamp("").has_value());
    CHECK_FALSE(utils::parse_timestamp("2023-13-01T00:00:00").has_value());
    CHECK_FALSE(utils::parse_timestamp("2023-02-30T00:00:00").has_value());
    CHECK_FALSE(utils::parse_timestamp("2023-01-01").has_value());
    CHECK_FALSE(utils::parse_timestamp("2023-01-01T00:00:00.").has_value());
    CHECK_FALSE(utils::parse_timestamp("2023-01-01T00:00:00Zjunk").has_value());
}

// ============================================================================
// Base64
// ============================================================================

TEST_CASE("base64 encodes with padding", "[utils][base64]") {
    const std::string text = "hello";
    CHECK(base64::encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()) == "aGVsbG8=");
    CHECK(base64::encode(std::vector<uint8_t>{}) == "");
}

TEST_CASE("base64 decode is strict", "[utils][base64]") {
    auto ok = base64::decode("aGVsbG8=");
    REQUIRE(ok.has_value());
    CHECK(std::string(ok->begin(), ok->end()) == "hello");

    CHECK_FALSE(base64::decode("aGVsbG8").has_value());     // length not a multiple of 4
    CHECK_FALSE(base64::decode("aGV=bG8=").has_value());    // padding in the middle
    CHECK_FALSE(base64::decode("aGVsbG9=").has_value());    // non-zero trailing bits
    CHECK_FALSE(base64::decode("aGVs*G8=").has_value());    // outside the alphabet
    CHECK_FALSE(base64::decode("aGVsbG8-").has_value());    // url-safe alphabet
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE("log level names parse case-sensitively", "[utils][log]") {
    CHECK(utils::log::parse_level("debug") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("verbose").has_value());
}

TEST_CASE("set_level changes the threshold", "[utils][log]") {
    const auto previous = utils::log::get_level();
    utils::log::set_level(utils::log::Level::ERROR);
    CHECK(utils::log::get_level() == utils::log::Level::ERROR);
    utils::log::set_level(previous);
}
