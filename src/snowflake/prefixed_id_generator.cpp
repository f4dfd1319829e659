#include "flakeid/snowflake/prefixed_id_generator.h"

namespace flakeid::snowflake {

std::string SnowflakeIdGenerator::next(const std::string_view prefix) {
  const auto id = generator_.next();
  if (!id.has_value()) {
    throw core::GenerationFailure(id.error());
  }
  return core::join_prefixed(prefix, std::to_string(id.value()));
}

}  // namespace flakeid::snowflake
