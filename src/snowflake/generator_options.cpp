#include "flakeid/snowflake/generator_options.h"

#include <limits>
#include <string>

namespace flakeid::snowflake {

core::Result<BitLayout, core::ConfigError> resolve_layout(const GeneratorOptions& options) {
  const int timestamp_bits =
      options.timestamp_bits.value_or(kPayloadBits - options.worker_bits - options.sequence_bits);
  return BitLayout::make(timestamp_bits, options.worker_bits, options.sequence_bits);
}

std::string validate_options(const GeneratorOptions& options) {
  if (options.epoch_unix_ms < 0) {
    return "epoch must not precede 1970-01-01T00:00:00Z (got " +
           std::to_string(options.epoch_unix_ms) + " ms)";
  }
  // Every decodable timestamp must map back to an int64 Unix millisecond.
  if (const auto layout = resolve_layout(options); layout.has_value()) {
    const auto max_timestamp = static_cast<std::int64_t>(layout.value().max_timestamp());
    if (options.epoch_unix_ms > std::numeric_limits<std::int64_t>::max() - max_timestamp) {
      return "epoch " + std::to_string(options.epoch_unix_ms) + " ms plus the " +
             std::to_string(layout.value().timestamp_bits()) +
             "-bit timestamp range overflows 64-bit Unix milliseconds";
    }
  }
  if (options.clock_rollback_tolerance_ms < 0) {
    return "clock rollback tolerance must be >= 0 ms (got " +
           std::to_string(options.clock_rollback_tolerance_ms) + ")";
  }
  if (options.max_wait.has_value() && options.max_wait->count() <= 0) {
    return "max wait must be > 0 ms when set (got " + std::to_string(options.max_wait->count()) +
           ")";
  }
  if (options.wait_poll_interval.count() < 0) {
    return "wait poll interval must be >= 0";
  }
  return "";
}

}  // namespace flakeid::snowflake
