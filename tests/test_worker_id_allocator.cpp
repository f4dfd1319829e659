#include "flakeid/core/hashing.h"
#include "flakeid/snowflake/worker_id_allocator.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::snowflake;

namespace {

constexpr std::uint32_t kMaxWorker = 1023;  // 10-bit worker field

}  // namespace

TEST_CASE("fnv1a_64: published test vectors", "[worker][hashing]") {
  CHECK(flakeid::core::fnv1a_64("") == 0xcbf29ce484222325ull);
  CHECK(flakeid::core::fnv1a_64("a") == 0xaf63dc4c8601ec8cull);
}

// ── Static ──────────────────────────────────────────────────────────────────

TEST_CASE("StaticWorkerIdAllocator: passes through ids inside the worker space", "[worker]") {
  const StaticWorkerIdAllocator allocator(1023);
  const auto id = allocator.allocate(kMaxWorker);
  REQUIRE(id.has_value());
  CHECK(id.value() == 1023u);
  CHECK_FALSE(allocator.is_derived());
}

TEST_CASE("StaticWorkerIdAllocator: rejects ids instead of wrapping them", "[worker]") {
  CHECK_FALSE(StaticWorkerIdAllocator(1024).allocate(kMaxWorker).has_value());
  CHECK_FALSE(StaticWorkerIdAllocator(-1).allocate(kMaxWorker).has_value());

  const auto id = StaticWorkerIdAllocator(4).allocate(3);
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error().message.find("[0, 3]") != std::string::npos);
}

// ── Hostname ────────────────────────────────────────────────────────────────

TEST_CASE("HostnameWorkerIdAllocator: same hostname always maps to the same id", "[worker]") {
  const HostnameWorkerIdAllocator allocator("api-7.eu-west.internal");
  const auto first = allocator.allocate(kMaxWorker);
  const auto second = allocator.allocate(kMaxWorker);

  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
  CHECK(first.value() == flakeid::core::fnv1a_64("api-7.eu-west.internal") % 1024);
  CHECK(allocator.is_derived());
}

TEST_CASE("HostnameWorkerIdAllocator: folds into small worker spaces", "[worker]") {
  const HostnameWorkerIdAllocator allocator("a");
  const auto id = allocator.allocate(1);
  REQUIRE(id.has_value());
  CHECK(id.value() == (0xaf63dc4c8601ec8cull % 2));
}

TEST_CASE("HostnameWorkerIdAllocator: empty hostname is rejected", "[worker]") {
  const HostnameWorkerIdAllocator allocator("");
  CHECK_FALSE(allocator.allocate(kMaxWorker).has_value());
}

TEST_CASE("HostnameWorkerIdAllocator: local hostname yields an id in range", "[worker]") {
  const HostnameWorkerIdAllocator allocator;
  const auto id = allocator.allocate(kMaxWorker);
  REQUIRE(id.has_value());
  CHECK(id.value() <= kMaxWorker);
}

// ── Process id ──────────────────────────────────────────────────────────────

TEST_CASE("ProcessIdWorkerIdAllocator: pid modulo the worker space", "[worker]") {
  const auto id = ProcessIdWorkerIdAllocator(1234).allocate(kMaxWorker);
  REQUIRE(id.has_value());
  CHECK(id.value() == 210u);

  const auto current = ProcessIdWorkerIdAllocator().allocate(kMaxWorker);
  REQUIRE(current.has_value());
  CHECK(current.value() <= kMaxWorker);
}

TEST_CASE("ProcessIdWorkerIdAllocator: negative pid is rejected", "[worker]") {
  CHECK_FALSE(ProcessIdWorkerIdAllocator(-5).allocate(kMaxWorker).has_value());
}

// ── Datacenter ──────────────────────────────────────────────────────────────

TEST_CASE("DatacenterWorkerIdAllocator: datacenter id occupies the high worker bits",
          "[worker]") {
  const DatacenterWorkerIdAllocator allocator(3, 7);
  const auto id = allocator.allocate(kMaxWorker);
  REQUIRE(id.has_value());
  CHECK(id.value() == (3u << 5 | 7u));
  CHECK_FALSE(allocator.is_derived());

  const auto max = DatacenterWorkerIdAllocator(31, 31).allocate(kMaxWorker);
  REQUIRE(max.has_value());
  CHECK(max.value() == kMaxWorker);
}

TEST_CASE("DatacenterWorkerIdAllocator: custom split", "[worker]") {
  const auto id = DatacenterWorkerIdAllocator(1, 0, 2).allocate(kMaxWorker);
  REQUIRE(id.has_value());
  CHECK(id.value() == 256u);
}

TEST_CASE("DatacenterWorkerIdAllocator: rejects parts outside their sub-fields", "[worker]") {
  SECTION("datacenter id too large") {
    CHECK_FALSE(DatacenterWorkerIdAllocator(32, 0).allocate(kMaxWorker).has_value());
  }

  SECTION("node id too large") {
    CHECK_FALSE(DatacenterWorkerIdAllocator(0, 32).allocate(kMaxWorker).has_value());
  }

  SECTION("negative parts") {
    CHECK_FALSE(DatacenterWorkerIdAllocator(-1, 0).allocate(kMaxWorker).has_value());
    CHECK_FALSE(DatacenterWorkerIdAllocator(0, -1).allocate(kMaxWorker).has_value());
  }

  SECTION("datacenter bits leave no node bits") {
    CHECK_FALSE(DatacenterWorkerIdAllocator(0, 0, 10).allocate(kMaxWorker).has_value());
  }

  SECTION("zero datacenter bits") {
    CHECK_FALSE(DatacenterWorkerIdAllocator(0, 0, 0).allocate(kMaxWorker).has_value());
  }
}

TEST_CASE("IWorkerIdAllocator::describe names the signal", "[worker]") {
  CHECK(StaticWorkerIdAllocator(12).describe() == "static (12)");
  CHECK(HostnameWorkerIdAllocator("box").describe() == "hostname (box)");
  CHECK(ProcessIdWorkerIdAllocator(99).describe() == "pid (99)");
  CHECK(DatacenterWorkerIdAllocator(2, 3).describe() == "datacenter (2/3, 5 datacenter bits)");
}
