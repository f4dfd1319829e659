#include "flakeid/core/hashing.h"

namespace flakeid::core {

std::uint64_t fnv1a_64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    // Cast through unsigned char so bytes >= 0x80 hash identically on signed-char platforms.
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kPrime;
  }
  return hash;
}

}  // namespace flakeid::core
