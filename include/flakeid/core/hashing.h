#pragma once

#include <cstdint>
#include <string_view>

namespace flakeid::core {

// fnv1a_64 is a stable, platform-independent 64-bit hash (FNV-1a).
// Used to fold local identity signals (hostnames) into the worker-id space; it is not
// a cryptographic hash.
[[nodiscard]] std::uint64_t fnv1a_64(std::string_view input);

}  // namespace flakeid::core
