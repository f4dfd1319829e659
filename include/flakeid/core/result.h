#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace flakeid::core {

// Error types following E.14 (use purpose-designed types as error indicators).

// ConfigError reports invalid construction parameters: worker id out of range,
// inconsistent bit widths, negative epoch or tolerance. Produced only while building a
// generator or an allocator, never by next().
struct ConfigError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

enum class GenerationErrorKind {
  kClockRollback,         // clock moved backward by more than the configured tolerance
  kTimeout,               // waiting for the clock exceeded the deadline
  kTimestampOutOfRange,   // clock reads before the epoch, or the timestamp field is exhausted
};

// GenerationError is returned by next() and never retried internally.
// rollback_ms is the observed backward jump for kClockRollback and 0 otherwise.
struct GenerationError {
  GenerationErrorKind kind{GenerationErrorKind::kClockRollback};  // NOLINT(readability-identifier-naming)
  std::int64_t rollback_ms{0};                                     // NOLINT(readability-identifier-naming)
  std::string message;                                             // NOLINT(readability-identifier-naming)
};

[[nodiscard]] constexpr std::string_view to_string(const GenerationErrorKind kind) {
  switch (kind) {
    case GenerationErrorKind::kClockRollback:
      return "clock_rollback";
    case GenerationErrorKind::kTimeout:
      return "timeout";
    case GenerationErrorKind::kTimestampOutOfRange:
      return "timestamp_out_of_range";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace flakeid::core
