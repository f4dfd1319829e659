#pragma once

#include "flakeid/core/id_generator.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include <string>
#include <string_view>

namespace flakeid::snowflake {

// Snowflake-backed string ID generator: prefix + decimal Snowflake value.
// IDs sharing a prefix sort by creation time when compared numerically on the tail.
// Thread-safe (delegates to SnowflakeGenerator). The generator is held by reference and
// must outlive this object.
class SnowflakeIdGenerator final : public core::IIdGenerator {
 public:
  explicit SnowflakeIdGenerator(SnowflakeGenerator& generator) : generator_(generator) {}
  ~SnowflakeIdGenerator() override = default;

  SnowflakeIdGenerator(const SnowflakeIdGenerator&) = delete;
  SnowflakeIdGenerator& operator=(const SnowflakeIdGenerator&) = delete;
  SnowflakeIdGenerator(SnowflakeIdGenerator&&) = delete;
  SnowflakeIdGenerator& operator=(SnowflakeIdGenerator&&) = delete;

  // Throws core::GenerationFailure when the underlying next() fails.
  std::string next(std::string_view prefix) override;

 private:
  SnowflakeGenerator& generator_;
};

}  // namespace flakeid::snowflake
