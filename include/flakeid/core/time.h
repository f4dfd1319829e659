#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// 2020-01-01T00:00:00Z, the default generator epoch.
constexpr std::int64_t kDefaultEpochUnixMillis = 1577836800000;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// parse_iso8601_utc_millis accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z" (UTC only, 1 to 3
// fraction digits) and returns Unix milliseconds, or nullopt if the text is malformed
// or names an impossible date.
[[nodiscard]] std::optional<std::int64_t> parse_iso8601_utc_millis(std::string_view text);

// Instants with a four-digit year: 0000-01-01T00:00:00.000Z .. 9999-12-31T23:59:59.999Z.
constexpr std::int64_t kMinIso8601UnixMillis = -62167219200000;
constexpr std::int64_t kMaxIso8601UnixMillis = 253402300799999;

// format_iso8601_utc_millis renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.fffZ".
// Returns nullopt outside [kMinIso8601UnixMillis, kMaxIso8601UnixMillis].
[[nodiscard]] std::optional<std::string> format_iso8601_utc_millis(std::int64_t unix_millis);

}  // namespace flakeid::core
