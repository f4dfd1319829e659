#include "decode_logic.h"

#include "flakeid/snowflake/snowflake_generator.h"

#include <nlohmann/json.hpp>

#include <charconv>

namespace flakeid::cli {

std::optional<std::uint64_t> parse_id_value(const std::string& text) {
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

int execute_decode(const std::vector<std::string>& ids, const snowflake::BitLayout& layout,
                   const std::int64_t epoch_unix_ms, std::ostream& out, std::ostream& err) {
  if (ids.empty()) {
    err << "Error: decode requires at least one identifier\n";
    return 1;
  }

  int exit_code = 0;
  for (const auto& text : ids) {
    const auto id = parse_id_value(text);
    if (!id.has_value()) {
      err << "Error: not a 64-bit unsigned decimal identifier: '" << text << "'\n";
      exit_code = 1;
      continue;
    }

    const snowflake::IdInfo info = snowflake::inspect_id(id.value(), layout, epoch_unix_ms);
    nlohmann::json j;
    j["id"] = info.id;
    j["iso8601_utc"] = info.iso8601_utc.has_value() ? nlohmann::json(*info.iso8601_utc)
                                                    : nlohmann::json();
    j["sequence"] = info.fields.sequence;
    j["timestamp_ms"] = info.fields.timestamp_ms;
    j["unix_ms"] = info.unix_ms.has_value() ? nlohmann::json(*info.unix_ms) : nlohmann::json();
    j["worker_id"] = info.fields.worker_id;
    out << j.dump() << "\n";
  }
  return exit_code;
}

}  // namespace flakeid::cli
