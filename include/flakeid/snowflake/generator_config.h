#pragma once

#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator_options.h"
#include "flakeid/snowflake/worker_id_allocator.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::snowflake {

// WorkerIdSource selects the IWorkerIdAllocator built from a GeneratorConfig.
// kStatic    : worker_id is used as-is (operator-assigned)
// kHostname  : hash of hostname (or the local hostname) modulo the worker space
// kProcessId : getpid() modulo the worker space
// kDatacenter: datacenter_id in the high datacenter_bits, worker_id as the node part
enum class WorkerIdSource {
  kStatic,      // NOLINT(readability-identifier-naming)
  kHostname,    // NOLINT(readability-identifier-naming)
  kProcessId,   // NOLINT(readability-identifier-naming)
  kDatacenter,  // NOLINT(readability-identifier-naming)
};

// Accepts "static", "hostname", "pid", "datacenter".
[[nodiscard]] std::optional<WorkerIdSource> parse_worker_id_source(std::string_view name);
[[nodiscard]] std::string_view to_string(WorkerIdSource source);

// GeneratorConfig is the deployable description of one generator instance: its options
// plus how its worker id is obtained.
struct GeneratorConfig {
  GeneratorOptions options;                                 // NOLINT(readability-identifier-naming)
  WorkerIdSource worker_source{WorkerIdSource::kStatic};    // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> worker_id;                    // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> datacenter_id;                // NOLINT(readability-identifier-naming)
  int datacenter_bits{DatacenterWorkerIdAllocator::kDefaultDatacenterBits};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> hostname;                      // NOLINT(readability-identifier-naming)
};

// generator_config_from_json overlays the keys present in json_str onto base.
//
// Keys (all optional):
//   epoch                       ISO-8601 UTC string, or integer Unix milliseconds
//   timestamp_bits              integer
//   worker_bits                 integer
//   sequence_bits               integer
//   clock_rollback_tolerance_ms integer
//   max_wait_ms                 integer, or null for no deadline
//   worker_source               "static" | "hostname" | "pid" | "datacenter"
//   worker_id                   integer
//   datacenter_id               integer
//   datacenter_bits             integer
//   hostname                    string
//
// Unknown keys are ignored. Returns an error message for malformed JSON, a non-object
// document, or a key with the wrong type. Range checks are left to the generator.
[[nodiscard]] core::Result<GeneratorConfig, std::string> generator_config_from_json(
    const std::string& json_str, GeneratorConfig base = {});

// load_generator_config reads a JSON file and applies generator_config_from_json.
[[nodiscard]] core::Result<GeneratorConfig, std::string> load_generator_config(
    const std::string& path, GeneratorConfig base = {});

// to_json serializes the effective configuration. Keys are sorted alphabetically and
// absent optionals are written as null, so output is deterministic.
[[nodiscard]] std::string to_json(const GeneratorConfig& config);

// make_worker_id_allocator builds the allocator named by worker_source.
// Returns an error message if a field required by that source is missing.
[[nodiscard]] core::Result<std::unique_ptr<IWorkerIdAllocator>, std::string>
make_worker_id_allocator(const GeneratorConfig& config);

}  // namespace flakeid::snowflake
