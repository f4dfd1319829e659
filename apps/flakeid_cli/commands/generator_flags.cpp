#include "generator_flags.h"

#include "flakeid/core/time.h"
#include "flakeid/core/version.h"

#include <charconv>
#include <iostream>

namespace flakeid::cli {

std::optional<std::int64_t> parse_int64_value(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::int64_t> parse_epoch_value(const std::string& text) {
  if (auto millis = parse_int64_value(text); millis.has_value()) {
    return millis;
  }
  return core::parse_iso8601_utc_millis(text);
}

namespace detail {

bool set_int64_flag(const char* flag, const std::string& value, std::optional<std::int64_t>& out) {
  const auto parsed = parse_int64_value(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected an integer)\n";
    return false;
  }
  out = *parsed;
  return true;
}

bool set_int_flag(const char* flag, const std::string& value, std::optional<int>& out) {
  const auto parsed = parse_int64_value(value);
  if (!parsed.has_value() || *parsed < 0 || *parsed > 64) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected an integer in [0, 64])\n";
    return false;
  }
  out = static_cast<int>(*parsed);
  return true;
}

bool set_epoch_flag(const std::string& value, std::optional<std::int64_t>& out) {
  const auto parsed = parse_epoch_value(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --epoch: " << value
              << " (expected YYYY-MM-DDTHH:MM:SS[.fff]Z or Unix milliseconds)\n";
    return false;
  }
  out = *parsed;
  return true;
}

bool set_worker_source_flag(const std::string& value,
                            std::optional<snowflake::WorkerIdSource>& out) {
  const auto parsed = snowflake::parse_worker_id_source(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --worker-source: " << value
              << " (valid: static, hostname, pid, datacenter)\n";
    return false;
  }
  out = *parsed;
  return true;
}

}  // namespace detail

core::Result<snowflake::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorCliConfig& cli) {
  using R = core::Result<snowflake::GeneratorConfig, std::string>;

  snowflake::GeneratorConfig config;
  if (cli.config_path.has_value()) {
    auto loaded = snowflake::load_generator_config(cli.config_path.value());
    if (!loaded.has_value()) {
      return R::err(loaded.error());
    }
    config = std::move(loaded.value());
  }

  // Flags override the file.
  if (cli.worker_id.has_value()) {
    config.worker_id = cli.worker_id;
  }
  if (cli.worker_source.has_value()) {
    config.worker_source = *cli.worker_source;
  }
  if (cli.datacenter_id.has_value()) {
    config.datacenter_id = cli.datacenter_id;
  }
  if (cli.datacenter_bits.has_value()) {
    config.datacenter_bits = *cli.datacenter_bits;
  }
  if (cli.epoch_unix_ms.has_value()) {
    config.options.epoch_unix_ms = *cli.epoch_unix_ms;
  }
  if (cli.worker_bits.has_value()) {
    config.options.worker_bits = *cli.worker_bits;
    // An explicit width pair re-derives the timestamp width.
    config.options.timestamp_bits = std::nullopt;
  }
  if (cli.sequence_bits.has_value()) {
    config.options.sequence_bits = *cli.sequence_bits;
    config.options.timestamp_bits = std::nullopt;
  }
  if (cli.rollback_tolerance_ms.has_value()) {
    config.options.clock_rollback_tolerance_ms = *cli.rollback_tolerance_ms;
  }
  if (cli.max_wait_ms.has_value()) {
    config.options.max_wait = std::chrono::milliseconds{*cli.max_wait_ms};
  }

  return R::ok(std::move(config));
}

std::string validate_generator_config(const snowflake::GeneratorConfig& config) {
  using snowflake::WorkerIdSource;

  switch (config.worker_source) {
    case WorkerIdSource::kStatic:
      if (!config.worker_id.has_value()) {
        return "Error: a worker id is required.\n"
               "       Pass --worker-id <n>, or derive one with --worker-source hostname|pid.";
      }
      break;
    case WorkerIdSource::kDatacenter:
      if (!config.datacenter_id.has_value() || !config.worker_id.has_value()) {
        return "Error: --worker-source datacenter requires --datacenter-id <n> and "
               "--worker-id <n>";
      }
      break;
    case WorkerIdSource::kHostname:
    case WorkerIdSource::kProcessId:
      if (config.worker_id.has_value()) {
        return "Error: --worker-id conflicts with --worker-source " +
               std::string(snowflake::to_string(config.worker_source)) +
               " (the worker id is derived)";
      }
      break;
  }
  return "";
}

std::unique_ptr<snowflake::SnowflakeGenerator> build_generator(
    const snowflake::GeneratorConfig& config, const core::IClock& clock, const bool quiet,
    std::ostream& diag) {
  const std::string config_error = validate_generator_config(config);
  if (!config_error.empty()) {
    diag << config_error << "\n";
    return nullptr;
  }

  auto allocator = snowflake::make_worker_id_allocator(config);
  if (!allocator.has_value()) {
    diag << "Error: " << allocator.error() << "\n";
    return nullptr;
  }

  auto created = snowflake::SnowflakeGenerator::create(*allocator.value(), config.options, clock);
  if (!created.has_value()) {
    diag << "Error: invalid generator configuration: " << created.error().message << "\n";
    return nullptr;
  }
  auto generator = std::move(created.value());

  if (!quiet) {
    // ── Startup diagnostic block ────────────────────────────────────────────
    const auto& layout = generator->layout();
    const auto& options = generator->options();
    diag << "flakeid v" << core::kBuildVersion << "\n";
    diag << "Worker:      " << generator->worker_id() << " -- "
         << allocator.value()->describe() << "\n";
    diag << "Layout:      " << layout.timestamp_bits() << "/" << layout.worker_bits() << "/"
         << layout.sequence_bits() << " bits (timestamp/worker/sequence), epoch "
         << core::format_iso8601_utc_millis(options.epoch_unix_ms)
                .value_or(std::to_string(options.epoch_unix_ms) + " ms")
         << "\n";
    if (options.clock_rollback_tolerance_ms == 0) {
      diag << "Rollback:    strict (any backward clock step fails)\n";
    } else {
      diag << "Rollback:    wait out steps up to " << options.clock_rollback_tolerance_ms
           << " ms\n";
    }
    if (options.max_wait.has_value()) {
      diag << "Wait limit:  " << options.max_wait->count() << " ms\n";
    } else {
      diag << "Wait limit:  none\n";
    }
    if (allocator.value()->is_derived()) {
      diag << "WARNING: Worker id is DERIVED from a local signal, not assigned.\n"
              "         Two instances that derive the same id will mint COLLIDING ids.\n"
              "         Pass --worker-id <n> with an operator-assigned id for production use.\n";
    }
  }

  return generator;
}

void print_generation_error(std::ostream& out, const core::GenerationError& error) {
  out << "Error: " << core::to_string(error.kind) << ": " << error.message << "\n";
}

}  // namespace flakeid::cli
