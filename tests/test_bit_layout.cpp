#include "flakeid/snowflake/bit_layout.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using flakeid::snowflake::BitLayout;
using flakeid::snowflake::DecodedId;

TEST_CASE("BitLayout::standard: 41/10/12 with matching shifts and maxima", "[bit_layout]") {
  const auto layout = BitLayout::standard();

  CHECK(layout.timestamp_bits() == 41);
  CHECK(layout.worker_bits() == 10);
  CHECK(layout.sequence_bits() == 12);
  CHECK(layout.worker_shift() == 12);
  CHECK(layout.timestamp_shift() == 22);
  CHECK(layout.max_worker_id() == 1023u);
  CHECK(layout.max_sequence() == 4095u);
  CHECK(layout.max_timestamp() == (std::uint64_t{1} << 41) - 1);
}

TEST_CASE("BitLayout::make: accepts any positive partition of 63 bits", "[bit_layout]") {
  const auto layout = BitLayout::make(39, 12, 12);
  REQUIRE(layout.has_value());
  CHECK(layout.value().max_worker_id() == 4095u);
  CHECK(layout.value().timestamp_shift() == 24);

  const auto wide = BitLayout::make(1, 31, 31);
  REQUIRE(wide.has_value());
  CHECK(wide.value().max_timestamp() == 1u);
  CHECK(wide.value().max_sequence() == 0x7FFFFFFFu);
}

TEST_CASE("BitLayout::make: rejects inconsistent widths", "[bit_layout][config]") {
  SECTION("zero-width field") {
    const auto layout = BitLayout::make(51, 0, 12);
    REQUIRE_FALSE(layout.has_value());
    CHECK_FALSE(layout.error().message.empty());
  }

  SECTION("negative width") {
    CHECK_FALSE(BitLayout::make(52, 12, -1).has_value());
  }

  SECTION("widths that do not sum to 63") {
    const auto layout = BitLayout::make(42, 10, 12);
    REQUIRE_FALSE(layout.has_value());
    CHECK(layout.error().message.find("63") != std::string::npos);
  }

  SECTION("worker field wider than 31 bits") {
    CHECK_FALSE(BitLayout::make(19, 32, 12).has_value());
  }

  SECTION("sequence field wider than 31 bits") {
    CHECK_FALSE(BitLayout::make(21, 10, 32).has_value());
  }
}

TEST_CASE("BitLayout: compose places fields at their shifts", "[bit_layout]") {
  const auto layout = BitLayout::standard();

  CHECK(layout.compose(1000, 5, 0) == 4194324480u);
  CHECK(layout.compose(1000, 5, 1) == 4194324481u);
  CHECK(layout.compose(0, 1023, 4095) == 0x3FFFFFu);
}

TEST_CASE("BitLayout: decode inverts compose", "[bit_layout]") {
  const auto layout = BitLayout::standard();

  CHECK(layout.decode(4194324480u) == DecodedId{.timestamp_ms = 1000, .worker_id = 5, .sequence = 0});
  CHECK(layout.decode(layout.compose(123456789, 700, 4000)) ==
        DecodedId{.timestamp_ms = 123456789, .worker_id = 700, .sequence = 4000});
}

TEST_CASE("BitLayout: decode ignores the reserved top bit", "[bit_layout]") {
  const auto layout = BitLayout::standard();

  const DecodedId all_ones = layout.decode(~std::uint64_t{0});
  CHECK(all_ones.timestamp_ms == layout.max_timestamp());
  CHECK(all_ones.worker_id == layout.max_worker_id());
  CHECK(all_ones.sequence == layout.max_sequence());

  const std::uint64_t id = layout.compose(1000, 5, 7);
  CHECK(layout.decode(id | (std::uint64_t{1} << 63)) == layout.decode(id));
}

TEST_CASE("BitLayout: composed ids keep the sign bit clear", "[bit_layout]") {
  const auto layout = BitLayout::standard();
  const std::uint64_t id =
      layout.compose(layout.max_timestamp(), layout.max_worker_id(), layout.max_sequence());

  CHECK(id == 0x7FFFFFFFFFFFFFFFu);
}
