#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/snowflake/generator_config.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include "shared/arg_parser.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace flakeid::cli {

// GeneratorCliConfig collects the generator flags shared by next, decode, prefixed and
// layout. Every field is optional: an absent flag leaves the config-file (or built-in)
// value in place.
struct GeneratorCliConfig {
  std::optional<std::string> config_path;                   // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> worker_id;                    // NOLINT(readability-identifier-naming)
  std::optional<snowflake::WorkerIdSource> worker_source;   // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> datacenter_id;                // NOLINT(readability-identifier-naming)
  std::optional<int> datacenter_bits;                       // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> epoch_unix_ms;                // NOLINT(readability-identifier-naming)
  std::optional<int> worker_bits;                           // NOLINT(readability-identifier-naming)
  std::optional<int> sequence_bits;                         // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> rollback_tolerance_ms;        // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> max_wait_ms;                  // NOLINT(readability-identifier-naming)
  bool quiet{false};                                        // NOLINT(readability-identifier-naming)
};

// parse_int64_value parses a whole decimal string (optional leading '-').
[[nodiscard]] std::optional<std::int64_t> parse_int64_value(const std::string& text);

// parse_epoch_value accepts an ISO-8601 UTC instant or integer Unix milliseconds.
[[nodiscard]] std::optional<std::int64_t> parse_epoch_value(const std::string& text);

// Option registry for the shared generator flags. Commands append their own options.
// Config must expose a `generator` member of type GeneratorCliConfig.
template <typename Config>
std::vector<apps::Option<Config>> generator_option_registry();

// resolve_generator_config loads --config (if given) and overlays the flags on top.
// Returns an error message on an unreadable or invalid config file.
[[nodiscard]] core::Result<snowflake::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorCliConfig& cli);

// validate_generator_config checks startup preconditions before any generator is built.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - worker source 'static' has a worker id
// - worker source 'datacenter' has both a datacenter id and a worker (node) id
// - worker source 'hostname' / 'pid' is not combined with an explicit worker id
[[nodiscard]] std::string validate_generator_config(const snowflake::GeneratorConfig& config);

// build_generator validates, allocates the worker id, constructs the generator and,
// unless quiet, writes the startup diagnostic block to diag.
// Returns nullptr after printing the error to diag on any failure.
[[nodiscard]] std::unique_ptr<snowflake::SnowflakeGenerator> build_generator(
    const snowflake::GeneratorConfig& config, const core::IClock& clock, bool quiet,
    std::ostream& diag);

// print_generation_error writes a GenerationError in a stable one-line format.
void print_generation_error(std::ostream& out, const core::GenerationError& error);

// ────────────────────────────────────────────────────────────────
// Template implementation
// ────────────────────────────────────────────────────────────────

namespace detail {

bool set_int64_flag(const char* flag, const std::string& value, std::optional<std::int64_t>& out);
bool set_int_flag(const char* flag, const std::string& value, std::optional<int>& out);
bool set_epoch_flag(const std::string& value, std::optional<std::int64_t>& out);
bool set_worker_source_flag(const std::string& value,
                            std::optional<snowflake::WorkerIdSource>& out);

}  // namespace detail

template <typename Config>
std::vector<apps::Option<Config>> generator_option_registry() {
  return {
      {"--config", true, "JSON generator config file (flags override its values)",
       [](Config& c, const std::string& v) {
         c.generator.config_path = v;
         return true;
       }},
      {"--worker-id", true, "Worker id (node id with --worker-source datacenter)",
       [](Config& c, const std::string& v) {
         return detail::set_int64_flag("--worker-id", v, c.generator.worker_id);
       }},
      {"--worker-source", true, "Worker id source (static|hostname|pid|datacenter)",
       [](Config& c, const std::string& v) {
         return detail::set_worker_source_flag(v, c.generator.worker_source);
       }},
      {"--datacenter-id", true, "Datacenter id (with --worker-source datacenter)",
       [](Config& c, const std::string& v) {
         return detail::set_int64_flag("--datacenter-id", v, c.generator.datacenter_id);
       }},
      {"--datacenter-bits", true, "High worker bits reserved for the datacenter id (default 5)",
       [](Config& c, const std::string& v) {
         return detail::set_int_flag("--datacenter-bits", v, c.generator.datacenter_bits);
       }},
      {"--epoch", true, "Epoch as ISO-8601 UTC or Unix ms (default 2020-01-01T00:00:00Z)",
       [](Config& c, const std::string& v) {
         return detail::set_epoch_flag(v, c.generator.epoch_unix_ms);
       }},
      {"--worker-bits", true, "Worker field width (default 10)",
       [](Config& c, const std::string& v) {
         return detail::set_int_flag("--worker-bits", v, c.generator.worker_bits);
       }},
      {"--sequence-bits", true, "Sequence field width (default 12)",
       [](Config& c, const std::string& v) {
         return detail::set_int_flag("--sequence-bits", v, c.generator.sequence_bits);
       }},
      {"--rollback-tolerance-ms", true, "Absorb clock rollbacks up to N ms (default 0: fail)",
       [](Config& c, const std::string& v) {
         return detail::set_int64_flag("--rollback-tolerance-ms", v,
                                       c.generator.rollback_tolerance_ms);
       }},
      {"--max-wait-ms", true, "Fail if waiting for the clock exceeds N ms (default: no limit)",
       [](Config& c, const std::string& v) {
         return detail::set_int64_flag("--max-wait-ms", v, c.generator.max_wait_ms);
       }},
      {"--quiet", false, "Suppress the startup diagnostic block on stderr",
       [](Config& c, const std::string&) {
         c.generator.quiet = true;
         return true;
       }},
  };
}

}  // namespace flakeid::cli
