#include "flakeid/snowflake/snowflake_generator.h"

#include "flakeid/core/time.h"

#include <limits>
#include <string>
#include <thread>
#include <utility>

namespace flakeid::snowflake {

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(const std::int64_t worker_id,
                                                            const GeneratorOptions& options,
                                                            const core::IClock& clock) {
  return create(StaticWorkerIdAllocator(worker_id), options, clock);
}

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(const IWorkerIdAllocator& allocator,
                                                            const GeneratorOptions& options,
                                                            const core::IClock& clock) {
  auto layout = resolve_layout(options);
  if (!layout.has_value()) {
    return CreateResult::err(layout.error());
  }

  const std::string options_error = validate_options(options);
  if (!options_error.empty()) {
    return CreateResult::err(core::ConfigError{options_error});
  }

  auto worker_id = allocator.allocate(layout.value().max_worker_id());
  if (!worker_id.has_value()) {
    return CreateResult::err(worker_id.error());
  }

  // Private constructor: make_unique cannot reach it.
  return CreateResult::ok(std::unique_ptr<SnowflakeGenerator>(
      new SnowflakeGenerator(worker_id.value(), layout.value(), options, clock)));
}

SnowflakeGenerator::SnowflakeGenerator(const std::uint32_t worker_id, BitLayout layout,
                                       GeneratorOptions options, const core::IClock& clock)
    : worker_id_(worker_id), layout_(layout), options_(std::move(options)), clock_(clock) {}

SnowflakeGenerator::IdResult SnowflakeGenerator::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_locked(options_.max_wait);
}

SnowflakeGenerator::IdResult SnowflakeGenerator::next(const std::chrono::milliseconds max_wait) {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_locked(max_wait);
}

SnowflakeGenerator::BatchResult SnowflakeGenerator::next_batch(const std::size_t count) {
  std::vector<std::uint64_t> ids;
  ids.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto id = next();
    if (!id.has_value()) {
      return BatchResult::err(id.error());
    }
    ids.push_back(id.value());
  }
  return BatchResult::ok(std::move(ids));
}

IdInfo SnowflakeGenerator::inspect(const std::uint64_t id) const {
  return inspect_id(id, layout_, options_.epoch_unix_ms);
}

SnowflakeGenerator::IdResult SnowflakeGenerator::next_locked(
    const std::optional<std::chrono::milliseconds> max_wait) {
  const auto started = std::chrono::steady_clock::now();
  std::int64_t ts = read_timestamp();

  // Clock rollback: refuse, or wait for the clock to return to the last used millisecond.
  // Checked before the epoch bound so a step back across the epoch still reports its size.
  if (last_timestamp_ms_ >= 0 && ts < last_timestamp_ms_) {
    if (last_timestamp_ms_ - ts > options_.clock_rollback_tolerance_ms) {
      return IdResult::err(rollback_error(ts));
    }
    auto caught_up = wait_for(last_timestamp_ms_, started, max_wait);
    if (!caught_up.has_value()) {
      return IdResult::err(caught_up.error());
    }
    ts = caught_up.value();
  }

  // Only reachable before the first success: afterwards ts >= last_timestamp_ms_ >= 0.
  if (ts < 0) {
    return IdResult::err(core::GenerationError{
        .kind = core::GenerationErrorKind::kTimestampOutOfRange,
        .rollback_ms = 0,
        .message = "clock reads " + std::to_string(-ts) + " ms before the configured epoch",
    });
  }

  std::uint32_t sequence = 0;
  if (ts == last_timestamp_ms_) {
    if (sequence_ >= layout_.max_sequence()) {
      // Sequence exhausted for this millisecond: throttle the caller until the next one.
      auto next_ms = wait_for(last_timestamp_ms_ + 1, started, max_wait);
      if (!next_ms.has_value()) {
        return IdResult::err(next_ms.error());
      }
      ts = next_ms.value();
    } else {
      sequence = sequence_ + 1;
    }
  }

  if (static_cast<std::uint64_t>(ts) > layout_.max_timestamp()) {
    return IdResult::err(core::GenerationError{
        .kind = core::GenerationErrorKind::kTimestampOutOfRange,
        .rollback_ms = 0,
        .message = "timestamp " + std::to_string(ts) + " ms exceeds the " +
                   std::to_string(layout_.timestamp_bits()) + "-bit timestamp field",
    });
  }

  last_timestamp_ms_ = ts;
  sequence_ = sequence;
  return IdResult::ok(layout_.compose(static_cast<std::uint64_t>(ts), worker_id_, sequence));
}

core::Result<std::int64_t, core::GenerationError> SnowflakeGenerator::wait_for(
    const std::int64_t min_ts, const std::chrono::steady_clock::time_point started,
    const std::optional<std::chrono::milliseconds> max_wait) const {
  using R = core::Result<std::int64_t, core::GenerationError>;

  while (true) {
    if (options_.wait_poll_interval.count() > 0) {
      std::this_thread::sleep_for(options_.wait_poll_interval);
    } else {
      std::this_thread::yield();
    }

    const std::int64_t ts = read_timestamp();
    if (ts >= min_ts) {
      return R::ok(ts);
    }
    // The clock may keep moving backward while we wait.
    if (last_timestamp_ms_ - ts > options_.clock_rollback_tolerance_ms) {
      return R::err(rollback_error(ts));
    }
    // Measured on the steady clock so a frozen injected clock still times out.
    if (max_wait.has_value() && std::chrono::steady_clock::now() - started >= *max_wait) {
      return R::err(core::GenerationError{
          .kind = core::GenerationErrorKind::kTimeout,
          .rollback_ms = 0,
          .message = "clock did not reach " + std::to_string(min_ts) + " ms within " +
                     std::to_string(max_wait->count()) + " ms (last read " + std::to_string(ts) +
                     " ms)",
      });
    }
  }
}

std::int64_t SnowflakeGenerator::read_timestamp() const {
  return clock_.now_unix_millis() - options_.epoch_unix_ms;
}

core::GenerationError SnowflakeGenerator::rollback_error(const std::int64_t ts) const {
  const std::int64_t magnitude = last_timestamp_ms_ - ts;
  return core::GenerationError{
      .kind = core::GenerationErrorKind::kClockRollback,
      .rollback_ms = magnitude,
      .message = "clock moved backward by " + std::to_string(magnitude) +
                 " ms (tolerance " + std::to_string(options_.clock_rollback_tolerance_ms) +
                 " ms); refusing to reuse a past millisecond",
  };
}

IdInfo inspect_id(const std::uint64_t id, const BitLayout& layout, const std::int64_t epoch_unix_ms) {
  const DecodedId fields = layout.decode(id);
  IdInfo info{.id = id, .fields = fields, .unix_ms = std::nullopt, .iso8601_utc = std::nullopt};

  // timestamp_ms < 2^63 always; only the addition can overflow.
  const auto offset = static_cast<std::int64_t>(fields.timestamp_ms);
  if (epoch_unix_ms > 0 && offset > std::numeric_limits<std::int64_t>::max() - epoch_unix_ms) {
    return info;
  }
  info.unix_ms = epoch_unix_ms + offset;
  info.iso8601_utc = core::format_iso8601_utc_millis(*info.unix_ms);
  return info;
}

}  // namespace flakeid::snowflake
