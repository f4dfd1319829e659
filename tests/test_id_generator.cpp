#include "flakeid/core/clock.h"
#include "flakeid/core/id_generator.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/prefixed_id_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>

using flakeid::core::GenerationErrorKind;
using flakeid::core::GenerationFailure;
using flakeid::core::kDefaultEpochUnixMillis;
using flakeid::core::ManualClock;
using flakeid::core::RandomTokenIdGenerator;
using flakeid::core::TokenEncoding;
using flakeid::snowflake::GeneratorOptions;
using flakeid::snowflake::SnowflakeGenerator;
using flakeid::snowflake::SnowflakeIdGenerator;

TEST_CASE("join_prefixed: dash-joins, or returns the tail alone", "[ids]") {
  CHECK(flakeid::core::join_prefixed("user", "42") == "user-42");
  CHECK(flakeid::core::join_prefixed("", "42") == "42");
}

TEST_CASE("SnowflakeIdGenerator: prefix plus decimal Snowflake value", "[ids]") {
  ManualClock clock(kDefaultEpochUnixMillis + 1000);
  auto created = SnowflakeGenerator::create(5, GeneratorOptions{}, clock);
  REQUIRE(created.has_value());
  SnowflakeIdGenerator gen(*created.value());

  CHECK(gen.next("user") == "user-4194324480");
  CHECK(gen.next("") == "4194324481");
}

TEST_CASE("SnowflakeIdGenerator: generation failure surfaces as GenerationFailure", "[ids]") {
  ManualClock clock(kDefaultEpochUnixMillis + 1000);
  auto created = SnowflakeGenerator::create(5, GeneratorOptions{}, clock);
  REQUIRE(created.has_value());
  SnowflakeIdGenerator gen(*created.value());

  REQUIRE_FALSE(gen.next("order").empty());
  clock.advance(-10);

  try {
    (void)gen.next("order");
    FAIL("expected GenerationFailure");
  } catch (const GenerationFailure& e) {
    CHECK(e.error().kind == GenerationErrorKind::kClockRollback);
    CHECK(e.error().rollback_ms == 10);
  }
}

TEST_CASE("RandomTokenIdGenerator: prefixed opaque tokens", "[ids]") {
  RandomTokenIdGenerator gen;

  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    const auto id = gen.next("sess");
    REQUIRE(id.rfind("sess-", 0) == 0);
    CHECK(id.size() == 5 + 43);
    seen.insert(id);
  }
  CHECK(seen.size() == 50);
}

TEST_CASE("RandomTokenIdGenerator: hex encoding and empty prefix", "[ids]") {
  RandomTokenIdGenerator gen(8, TokenEncoding::kHex);
  const auto id = gen.next("");
  CHECK(id.size() == 16);
  CHECK(id.find('-') == std::string::npos);
}

TEST_CASE("RandomTokenIdGenerator: zero-length tokens are rejected at construction", "[ids]") {
  CHECK_THROWS_AS(RandomTokenIdGenerator(0), std::invalid_argument);
}
