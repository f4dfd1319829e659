#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/snowflake/bit_layout.h"
#include "flakeid/snowflake/generator_options.h"
#include "flakeid/snowflake/worker_id_allocator.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::snowflake {

// IdInfo is DecodedId plus the absolute instant the identifier was minted in.
// unix_ms is nullopt when epoch + timestamp does not fit in int64; iso8601_utc is nullopt
// when the instant has no four-digit-year rendering.
struct IdInfo {
  std::uint64_t id{0};                       // NOLINT(readability-identifier-naming)
  DecodedId fields;                          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> unix_ms;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> iso8601_utc;    // NOLINT(readability-identifier-naming)
};

// SnowflakeGenerator mints 64-bit identifiers that are strictly increasing per instance
// and disjoint across instances with distinct worker ids.
//
// State machine (per next() call, under one mutex):
//   ts >  last  -> sequence = 0
//   ts == last  -> sequence + 1; on overflow wait for ts > last, then sequence = 0
//   ts <  last  -> rollback: fail if last - ts > tolerance, otherwise wait for ts >= last
//
// A failed call leaves (last_timestamp_ms, sequence) untouched.
//
// Thread-safety: all public methods may be called concurrently. next() holds the lock
// for the full read-compare-increment-assemble section, including any wait.
//
// Lifetime: the clock is held by reference and must outlive the generator.
class SnowflakeGenerator {
 public:
  using IdResult = core::Result<std::uint64_t, core::GenerationError>;
  using BatchResult = core::Result<std::vector<std::uint64_t>, core::GenerationError>;
  using CreateResult = core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError>;

  // Build a generator for an explicit worker id in [0, 2^worker_bits - 1].
  [[nodiscard]] static CreateResult create(std::int64_t worker_id, const GeneratorOptions& options,
                                           const core::IClock& clock);

  // Build a generator whose worker id comes from an allocator.
  [[nodiscard]] static CreateResult create(const IWorkerIdAllocator& allocator,
                                           const GeneratorOptions& options,
                                           const core::IClock& clock);

  ~SnowflakeGenerator() = default;

  // Not copyable or movable (owns a mutex and exclusive generator state)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  // Mint the next identifier using options.max_wait as the wait deadline.
  [[nodiscard]] IdResult next();

  // Mint the next identifier, bounding any wait by max_wait instead of options.max_wait.
  [[nodiscard]] IdResult next(std::chrono::milliseconds max_wait);

  // Mint `count` identifiers by repeated next(). The first failure aborts the batch;
  // identifiers minted before it are discarded, never reissued.
  [[nodiscard]] BatchResult next_batch(std::size_t count);

  // Split an identifier into its fields using this generator's layout. Pure.
  [[nodiscard]] DecodedId decode(std::uint64_t id) const { return layout_.decode(id); }

  // decode() plus absolute time, using this generator's epoch.
  [[nodiscard]] IdInfo inspect(std::uint64_t id) const;

  [[nodiscard]] std::uint32_t worker_id() const { return worker_id_; }
  [[nodiscard]] const BitLayout& layout() const { return layout_; }
  [[nodiscard]] const GeneratorOptions& options() const { return options_; }

 private:
  SnowflakeGenerator(std::uint32_t worker_id, BitLayout layout, GeneratorOptions options,
                     const core::IClock& clock);

  [[nodiscard]] IdResult next_locked(std::optional<std::chrono::milliseconds> max_wait);

  // Poll the clock until it reads at least min_ts (relative to the epoch).
  [[nodiscard]] core::Result<std::int64_t, core::GenerationError> wait_for(
      std::int64_t min_ts, std::chrono::steady_clock::time_point started,
      std::optional<std::chrono::milliseconds> max_wait) const;

  [[nodiscard]] std::int64_t read_timestamp() const;
  [[nodiscard]] core::GenerationError rollback_error(std::int64_t ts) const;

  const std::uint32_t worker_id_;
  const BitLayout layout_;
  const GeneratorOptions options_;
  const core::IClock& clock_;

  std::mutex mutex_;
  std::int64_t last_timestamp_ms_{-1};  // -1: nothing minted yet
  std::uint32_t sequence_{0};
};

// inspect_id is SnowflakeGenerator::inspect for callers that only hold a layout and epoch.
[[nodiscard]] IdInfo inspect_id(std::uint64_t id, const BitLayout& layout,
                                std::int64_t epoch_unix_ms);

}  // namespace flakeid::snowflake
