#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

using flakeid::core::format_iso8601_utc_millis;
using flakeid::core::kDefaultEpochUnixMillis;
using flakeid::core::parse_iso8601_utc_millis;

TEST_CASE("parse_iso8601_utc_millis: accepts whole seconds and 1-3 fraction digits", "[time]") {
  CHECK(parse_iso8601_utc_millis("2020-01-01T00:00:00Z") == kDefaultEpochUnixMillis);
  CHECK(parse_iso8601_utc_millis("1970-01-01T00:00:00Z") == 0);
  CHECK(parse_iso8601_utc_millis("2020-01-01T00:00:01.5Z") == kDefaultEpochUnixMillis + 1500);
  CHECK(parse_iso8601_utc_millis("2020-01-01T00:00:01.25Z") == kDefaultEpochUnixMillis + 1250);
  CHECK(parse_iso8601_utc_millis("2020-01-01T00:00:01.234Z") == kDefaultEpochUnixMillis + 1234);
  CHECK(parse_iso8601_utc_millis("2010-11-04T01:42:54.657Z") == 1288834974657);
}

TEST_CASE("parse_iso8601_utc_millis: rejects malformed or impossible instants", "[time]") {
  CHECK_FALSE(parse_iso8601_utc_millis("").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01 00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01T00:00:00").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01T00:00:00+01:00").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01T00:00:00.Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01T00:00:00.1234Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-02-30T00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2021-02-29T00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-13-01T00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc_millis("2020-01-01T24:00:00Z").has_value());
}

TEST_CASE("format_iso8601_utc_millis: always renders three fraction digits", "[time]") {
  CHECK(format_iso8601_utc_millis(0) == "1970-01-01T00:00:00.000Z");
  CHECK(format_iso8601_utc_millis(kDefaultEpochUnixMillis) == "2020-01-01T00:00:00.000Z");
  CHECK(format_iso8601_utc_millis(kDefaultEpochUnixMillis + 1234) == "2020-01-01T00:00:01.234Z");
}

TEST_CASE("format_iso8601_utc_millis: output parses back to the same instant", "[time]") {
  const auto leap_day = parse_iso8601_utc_millis("2024-02-29T12:34:56.789Z");
  REQUIRE(leap_day.has_value());
  CHECK(format_iso8601_utc_millis(*leap_day) == "2024-02-29T12:34:56.789Z");
}

TEST_CASE("format_iso8601_utc_millis: no rendering outside four-digit years", "[time]") {
  using flakeid::core::kMaxIso8601UnixMillis;
  using flakeid::core::kMinIso8601UnixMillis;

  CHECK(format_iso8601_utc_millis(kMinIso8601UnixMillis) == "0000-01-01T00:00:00.000Z");
  CHECK(format_iso8601_utc_millis(kMaxIso8601UnixMillis) == "9999-12-31T23:59:59.999Z");
  CHECK_FALSE(format_iso8601_utc_millis(kMinIso8601UnixMillis - 1).has_value());
  CHECK_FALSE(format_iso8601_utc_millis(kMaxIso8601UnixMillis + 1).has_value());
  CHECK_FALSE(format_iso8601_utc_millis(std::numeric_limits<std::int64_t>::max()).has_value());
}
