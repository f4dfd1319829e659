#include "flakeid/core/time.h"

#include <iomanip>
#include <sstream>

namespace flakeid::core {

namespace {

// Reads exactly `width` decimal digits starting at `pos`.
std::optional<int> read_digits(const std::string_view text, const std::size_t pos,
                               const std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  return value;
}

}  // namespace

std::optional<std::int64_t> parse_iso8601_utc_millis(const std::string_view text) {
  // Fixed-width prefix: YYYY-MM-DDTHH:MM:SS (19 chars)
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't') ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  const auto year = read_digits(text, 0, 4);
  const auto month = read_digits(text, 5, 2);
  const auto day = read_digits(text, 8, 2);
  const auto hour = read_digits(text, 11, 2);
  const auto minute = read_digits(text, 14, 2);
  const auto second = read_digits(text, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }
  if (*hour > 23 || *minute > 59 || *second > 59) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  int millis = 0;
  if (text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits >= 3) {
        return std::nullopt;
      }
      millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  if (pos + 1 != text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  const auto midnight = std::chrono::sys_days{ymd};
  const auto instant = midnight + std::chrono::hours{*hour} + std::chrono::minutes{*minute} +
                       std::chrono::seconds{*second} + std::chrono::milliseconds{millis};
  return std::chrono::duration_cast<std::chrono::milliseconds>(instant.time_since_epoch()).count();
}

std::optional<std::string> format_iso8601_utc_millis(const std::int64_t unix_millis) {
  if (unix_millis < kMinIso8601UnixMillis || unix_millis > kMaxIso8601UnixMillis) {
    return std::nullopt;
  }

  const std::chrono::sys_time<std::chrono::milliseconds> instant{
      std::chrono::milliseconds{unix_millis}};
  const auto midnight = std::chrono::floor<std::chrono::days>(instant);
  const std::chrono::year_month_day ymd{midnight};
  const std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{instant - midnight};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << '.' << std::setw(3) << tod.subseconds().count() << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
