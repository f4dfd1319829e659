#include "next_logic.h"

#include "generator_flags.h"

#include <nlohmann/json.hpp>

namespace flakeid::cli {

int execute_next(snowflake::SnowflakeGenerator& generator, const std::size_t count,
                 const bool as_json, std::ostream& out, std::ostream& err) {
  if (as_json) {
    const auto batch = generator.next_batch(count);
    if (!batch.has_value()) {
      print_generation_error(err, batch.error());
      return 1;
    }
    out << nlohmann::json(batch.value()).dump() << "\n";
    return 0;
  }

  for (std::size_t i = 0; i < count; ++i) {
    const auto id = generator.next();
    if (!id.has_value()) {
      print_generation_error(err, id.error());
      return 1;
    }
    out << id.value() << "\n";
  }
  return 0;
}

}  // namespace flakeid::cli
