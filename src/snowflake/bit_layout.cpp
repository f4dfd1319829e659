#include "flakeid/snowflake/bit_layout.h"

#include <string>

namespace flakeid::snowflake {

core::Result<BitLayout, core::ConfigError> BitLayout::make(const int timestamp_bits,
                                                           const int worker_bits,
                                                           const int sequence_bits) {
  using R = core::Result<BitLayout, core::ConfigError>;

  if (timestamp_bits < 1 || worker_bits < 1 || sequence_bits < 1) {
    return R::err(core::ConfigError{
        "bit widths must be positive (timestamp=" + std::to_string(timestamp_bits) +
        ", worker=" + std::to_string(worker_bits) + ", sequence=" + std::to_string(sequence_bits) +
        ")"});
  }
  if (worker_bits > kMaxFieldBits || sequence_bits > kMaxFieldBits) {
    return R::err(core::ConfigError{"worker and sequence widths must not exceed " +
                                    std::to_string(kMaxFieldBits) + " bits"});
  }
  // Checked after the per-field bounds so the sum cannot overflow.
  if (timestamp_bits + worker_bits + sequence_bits != kPayloadBits) {
    return R::err(core::ConfigError{
        "bit widths must sum to " + std::to_string(kPayloadBits) + " (got " +
        std::to_string(timestamp_bits + worker_bits + sequence_bits) + ")"});
  }

  return R::ok(BitLayout(timestamp_bits, worker_bits, sequence_bits));
}

BitLayout BitLayout::standard() {
  return BitLayout(kDefaultTimestampBits, kDefaultWorkerBits, kDefaultSequenceBits);
}

std::uint64_t BitLayout::compose(const std::uint64_t timestamp_ms, const std::uint32_t worker_id,
                                 const std::uint32_t sequence) const {
  return ((timestamp_ms & max_timestamp()) << timestamp_shift()) |
         ((static_cast<std::uint64_t>(worker_id) & mask(worker_bits_)) << worker_shift()) |
         (static_cast<std::uint64_t>(sequence) & mask(sequence_bits_));
}

DecodedId BitLayout::decode(const std::uint64_t id) const {
  return DecodedId{
      .timestamp_ms = (id >> timestamp_shift()) & max_timestamp(),
      .worker_id = static_cast<std::uint32_t>((id >> worker_shift()) & mask(worker_bits_)),
      .sequence = static_cast<std::uint32_t>(id & mask(sequence_bits_)),
  };
}

}  // namespace flakeid::snowflake
