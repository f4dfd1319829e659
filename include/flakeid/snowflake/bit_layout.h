#pragma once

#include "flakeid/core/result.h"

#include <cstdint>

namespace flakeid::snowflake {

// Identifier bit layout, most- to least-significant:
//
//   | 1 reserved (0) | timestamp_bits | worker_bits | sequence_bits |
//
// timestamp_bits + worker_bits + sequence_bits == 63, each at least 1. worker_bits and
// sequence_bits are capped at 31 so both fields fit a 32-bit unsigned value.
constexpr int kPayloadBits = 63;
constexpr int kMaxFieldBits = 31;
constexpr int kDefaultWorkerBits = 10;
constexpr int kDefaultSequenceBits = 12;
constexpr int kDefaultTimestampBits = kPayloadBits - kDefaultWorkerBits - kDefaultSequenceBits;

// DecodedId is the field-by-field view of an identifier.
// timestamp_ms is relative to the generator epoch, not to the Unix epoch.
struct DecodedId {
  std::uint64_t timestamp_ms{0};  // NOLINT(readability-identifier-naming)
  std::uint32_t worker_id{0};     // NOLINT(readability-identifier-naming)
  std::uint32_t sequence{0};      // NOLINT(readability-identifier-naming)

  bool operator==(const DecodedId&) const = default;
};

// BitLayout is a validated field partition. Construct through make(); the private
// constructor keeps every live instance consistent.
class BitLayout {
 public:
  // make rejects any width below 1, worker or sequence widths above 31, and widths
  // that do not sum to 63.
  [[nodiscard]] static core::Result<BitLayout, core::ConfigError> make(int timestamp_bits,
                                                                       int worker_bits,
                                                                       int sequence_bits);

  // 41 / 10 / 12.
  [[nodiscard]] static BitLayout standard();

  [[nodiscard]] int timestamp_bits() const { return timestamp_bits_; }
  [[nodiscard]] int worker_bits() const { return worker_bits_; }
  [[nodiscard]] int sequence_bits() const { return sequence_bits_; }

  [[nodiscard]] int worker_shift() const { return sequence_bits_; }
  [[nodiscard]] int timestamp_shift() const { return sequence_bits_ + worker_bits_; }

  [[nodiscard]] std::uint64_t max_timestamp() const { return mask(timestamp_bits_); }
  [[nodiscard]] std::uint32_t max_worker_id() const {
    return static_cast<std::uint32_t>(mask(worker_bits_));
  }
  [[nodiscard]] std::uint32_t max_sequence() const {
    return static_cast<std::uint32_t>(mask(sequence_bits_));
  }

  // compose packs already range-checked fields. Out-of-range inputs are masked, so
  // callers must validate first.
  [[nodiscard]] std::uint64_t compose(std::uint64_t timestamp_ms, std::uint32_t worker_id,
                                      std::uint32_t sequence) const;

  // decode is the exact inverse of compose. The reserved top bit is ignored, so every
  // 64-bit input decodes.
  [[nodiscard]] DecodedId decode(std::uint64_t id) const;

  bool operator==(const BitLayout&) const = default;

 private:
  BitLayout(int timestamp_bits, int worker_bits, int sequence_bits)
      : timestamp_bits_(timestamp_bits), worker_bits_(worker_bits), sequence_bits_(sequence_bits) {}

  [[nodiscard]] static constexpr std::uint64_t mask(const int bits) {
    return (std::uint64_t{1} << bits) - 1;
  }

  int timestamp_bits_;
  int worker_bits_;
  int sequence_bits_;
};

}  // namespace flakeid::snowflake
