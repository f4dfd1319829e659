#pragma once

#include "flakeid/snowflake/bit_layout.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace flakeid::cli {

// parse_id_value parses a decimal identifier. Rejects signs, blanks, and values that do
// not fit in 64 bits.
[[nodiscard]] std::optional<std::uint64_t> parse_id_value(const std::string& text);

// execute_decode writes one JSON object per identifier to out:
//   {"id":..,"iso8601_utc":"..","sequence":..,"timestamp_ms":..,"unix_ms":..,"worker_id":..}
// iso8601_utc and unix_ms are null when the instant cannot be represented.
// Unparseable inputs are reported to err and skipped; the rest are still decoded.
// Returns 0 if every input decoded, 1 otherwise (including an empty input list).
int execute_decode(const std::vector<std::string>& ids, const snowflake::BitLayout& layout,
                   std::int64_t epoch_unix_ms, std::ostream& out, std::ostream& err);

}  // namespace flakeid::cli
