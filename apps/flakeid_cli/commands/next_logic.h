#pragma once

#include "flakeid/snowflake/snowflake_generator.h"

#include <cstddef>
#include <ostream>

namespace flakeid::cli {

// execute_next mints `count` identifiers from generator and writes them to out, one
// decimal value per line, or as a single JSON array when as_json is set.
// Line mode prints each identifier as soon as it is minted; on a generation failure the
// identifiers already printed stay valid and the error goes to err.
// Returns the process exit code (0 success, 1 failure).
int execute_next(snowflake::SnowflakeGenerator& generator, std::size_t count, bool as_json,
                 std::ostream& out, std::ostream& err);

}  // namespace flakeid::cli
