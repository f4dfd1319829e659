#pragma once

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/bit_layout.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::snowflake {

// GeneratorOptions holds every tunable of a SnowflakeGenerator except the worker id.
// Every field has an explicit default; optional fields mean "not configured".
struct GeneratorOptions {
  // Reference instant, in Unix milliseconds, from which the timestamp field counts.
  std::int64_t epoch_unix_ms{core::kDefaultEpochUnixMillis};  // NOLINT(readability-identifier-naming)

  // Derived as 63 - worker_bits - sequence_bits when absent.
  std::optional<int> timestamp_bits;            // NOLINT(readability-identifier-naming)
  int worker_bits{kDefaultWorkerBits};          // NOLINT(readability-identifier-naming)
  int sequence_bits{kDefaultSequenceBits};      // NOLINT(readability-identifier-naming)

  // Backward clock jumps up to this many milliseconds are absorbed by waiting for the
  // clock to catch up. 0 fails every rollback immediately.
  std::int64_t clock_rollback_tolerance_ms{0};  // NOLINT(readability-identifier-naming)

  // Upper bound on a single wait for the clock (sequence overflow or tolerated rollback).
  // Absent means wait until the clock advances.
  std::optional<std::chrono::milliseconds> max_wait;  // NOLINT(readability-identifier-naming)

  // Sleep between clock polls while waiting.
  std::chrono::microseconds wait_poll_interval{100};  // NOLINT(readability-identifier-naming)
};

// resolve_layout validates the width fields of options and builds the BitLayout.
[[nodiscard]] core::Result<BitLayout, core::ConfigError> resolve_layout(
    const GeneratorOptions& options);

// validate_options checks the non-layout fields: epoch >= 0, epoch plus the largest
// timestamp fits in int64 (when the widths resolve), tolerance >= 0, max_wait > 0 when
// set, poll interval >= 0.
// Returns "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_options(const GeneratorOptions& options);

}  // namespace flakeid::snowflake
