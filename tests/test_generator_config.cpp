#include "flakeid/core/time.h"
#include "flakeid/snowflake/generator_config.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace flakeid::snowflake;

// ── JSON parsing ────────────────────────────────────────────────────────────

TEST_CASE("generator_config_from_json: empty object keeps every default", "[config]") {
  const auto config = generator_config_from_json("{}");
  REQUIRE(config.has_value());

  const auto& options = config.value().options;
  CHECK(options.epoch_unix_ms == flakeid::core::kDefaultEpochUnixMillis);
  CHECK_FALSE(options.timestamp_bits.has_value());
  CHECK(options.worker_bits == 10);
  CHECK(options.sequence_bits == 12);
  CHECK(options.clock_rollback_tolerance_ms == 0);
  CHECK_FALSE(options.max_wait.has_value());
  CHECK(config.value().worker_source == WorkerIdSource::kStatic);
  CHECK_FALSE(config.value().worker_id.has_value());
}

TEST_CASE("generator_config_from_json: reads every key", "[config]") {
  const auto config = generator_config_from_json(R"({
    "epoch": "2010-11-04T01:42:54.657Z",
    "timestamp_bits": 39,
    "worker_bits": 12,
    "sequence_bits": 12,
    "clock_rollback_tolerance_ms": 5,
    "max_wait_ms": 250,
    "worker_source": "datacenter",
    "worker_id": 9,
    "datacenter_id": 2,
    "datacenter_bits": 4,
    "hostname": "node-a"
  })");
  REQUIRE(config.has_value());

  const auto& c = config.value();
  CHECK(c.options.epoch_unix_ms == 1288834974657);
  CHECK(c.options.timestamp_bits == 39);
  CHECK(c.options.worker_bits == 12);
  CHECK(c.options.sequence_bits == 12);
  CHECK(c.options.clock_rollback_tolerance_ms == 5);
  REQUIRE(c.options.max_wait.has_value());
  CHECK(c.options.max_wait->count() == 250);
  CHECK(c.worker_source == WorkerIdSource::kDatacenter);
  CHECK(c.worker_id == 9);
  CHECK(c.datacenter_id == 2);
  CHECK(c.datacenter_bits == 4);
  CHECK(c.hostname == "node-a");
}

TEST_CASE("generator_config_from_json: epoch may be integer milliseconds", "[config]") {
  const auto config = generator_config_from_json(R"({"epoch": 1288834974657})");
  REQUIRE(config.has_value());
  CHECK(config.value().options.epoch_unix_ms == 1288834974657);
}

TEST_CASE("generator_config_from_json: overlays onto a base config", "[config]") {
  GeneratorConfig base;
  base.worker_id = 3;
  base.options.max_wait = std::chrono::milliseconds(100);

  const auto config = generator_config_from_json(R"({"sequence_bits": 8, "max_wait_ms": null})", base);
  REQUIRE(config.has_value());
  CHECK(config.value().worker_id == 3);
  CHECK(config.value().options.sequence_bits == 8);
  CHECK_FALSE(config.value().options.max_wait.has_value());
}

TEST_CASE("generator_config_from_json: reports malformed documents", "[config]") {
  SECTION("invalid JSON") {
    const auto config = generator_config_from_json("{ not json");
    REQUIRE_FALSE(config.has_value());
    CHECK(config.error().find("invalid JSON") != std::string::npos);
  }

  SECTION("top-level array") {
    CHECK_FALSE(generator_config_from_json("[1, 2]").has_value());
  }

  SECTION("wrong value type") {
    const auto config = generator_config_from_json(R"({"worker_id": "five"})");
    REQUIRE_FALSE(config.has_value());
    CHECK(config.error() == "config key 'worker_id' must be an integer");
  }

  SECTION("unparseable epoch") {
    CHECK_FALSE(generator_config_from_json(R"({"epoch": "yesterday"})").has_value());
  }

  SECTION("unknown worker source") {
    CHECK_FALSE(generator_config_from_json(R"({"worker_source": "mac"})").has_value());
  }

  SECTION("width far out of range") {
    CHECK_FALSE(generator_config_from_json(R"({"worker_bits": 100000})").has_value());
  }
}

// ── Files ───────────────────────────────────────────────────────────────────

TEST_CASE("load_generator_config: reads a JSON file", "[config]") {
  const auto path = std::filesystem::temp_directory_path() / "flakeid_test_generator_config.json";
  {
    std::ofstream out(path);
    out << R"({"worker_id": 17, "clock_rollback_tolerance_ms": 10})";
  }

  const auto config = load_generator_config(path.string());
  std::filesystem::remove(path);

  REQUIRE(config.has_value());
  CHECK(config.value().worker_id == 17);
  CHECK(config.value().options.clock_rollback_tolerance_ms == 10);
}

TEST_CASE("load_generator_config: missing file is an error naming the path", "[config]") {
  const auto config = load_generator_config("/nonexistent/flakeid.json");
  REQUIRE_FALSE(config.has_value());
  CHECK(config.error().find("/nonexistent/flakeid.json") != std::string::npos);
}

// ── Serialization ───────────────────────────────────────────────────────────

TEST_CASE("to_json: defaults serialize deterministically", "[config]") {
  CHECK(to_json(GeneratorConfig{}) ==
        R"({"clock_rollback_tolerance_ms":0,"datacenter_bits":5,"datacenter_id":null,)"
        R"("epoch":"2020-01-01T00:00:00.000Z","hostname":null,"max_wait_ms":null,)"
        R"("sequence_bits":12,"timestamp_bits":null,"worker_bits":10,"worker_id":null,)"
        R"("worker_source":"static"})");
}

TEST_CASE("to_json: output reloads to an equivalent config", "[config]") {
  GeneratorConfig saved;
  saved.worker_source = WorkerIdSource::kHostname;
  saved.hostname = "edge-3";
  saved.options.epoch_unix_ms = 1288834974657;
  saved.options.max_wait = std::chrono::milliseconds(40);

  const auto reloaded = generator_config_from_json(to_json(saved));
  REQUIRE(reloaded.has_value());
  CHECK(reloaded.value().worker_source == WorkerIdSource::kHostname);
  CHECK(reloaded.value().hostname == "edge-3");
  CHECK(reloaded.value().options.epoch_unix_ms == 1288834974657);
  REQUIRE(reloaded.value().options.max_wait.has_value());
  CHECK(reloaded.value().options.max_wait->count() == 40);
}

// ── Allocator selection ─────────────────────────────────────────────────────

TEST_CASE("make_worker_id_allocator: builds the allocator named by worker_source", "[config]") {
  GeneratorConfig config;

  SECTION("static without a worker id") {
    CHECK_FALSE(make_worker_id_allocator(config).has_value());
  }

  SECTION("static with a worker id") {
    config.worker_id = 12;
    const auto allocator = make_worker_id_allocator(config);
    REQUIRE(allocator.has_value());
    CHECK(allocator.value()->allocate(1023).value() == 12u);
  }

  SECTION("hostname with an explicit name") {
    config.worker_source = WorkerIdSource::kHostname;
    config.hostname = "node-a";
    const auto allocator = make_worker_id_allocator(config);
    REQUIRE(allocator.has_value());
    CHECK(allocator.value()->is_derived());
    CHECK(allocator.value()->describe() == "hostname (node-a)");
  }

  SECTION("pid") {
    config.worker_source = WorkerIdSource::kProcessId;
    const auto allocator = make_worker_id_allocator(config);
    REQUIRE(allocator.has_value());
    CHECK(allocator.value()->is_derived());
  }

  SECTION("datacenter needs both ids") {
    config.worker_source = WorkerIdSource::kDatacenter;
    config.datacenter_id = 1;
    CHECK_FALSE(make_worker_id_allocator(config).has_value());

    config.worker_id = 2;
    const auto allocator = make_worker_id_allocator(config);
    REQUIRE(allocator.has_value());
    CHECK(allocator.value()->allocate(1023).value() == (1u << 5 | 2u));
  }
}

TEST_CASE("parse_worker_id_source: round-trips through to_string", "[config]") {
  for (const auto source : {WorkerIdSource::kStatic, WorkerIdSource::kHostname,
                            WorkerIdSource::kProcessId, WorkerIdSource::kDatacenter}) {
    CHECK(parse_worker_id_source(to_string(source)) == source);
  }
  CHECK_FALSE(parse_worker_id_source("random").has_value());
}
