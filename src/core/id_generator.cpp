#include "flakeid/core/id_generator.h"

namespace flakeid::core {

std::string join_prefixed(const std::string_view prefix, const std::string_view tail) {
  if (prefix.empty()) {
    return std::string(tail);
  }
  std::string id;
  id.reserve(prefix.size() + 1 + tail.size());
  id.append(prefix);
  id.push_back('-');
  id.append(tail);
  return id;
}

RandomTokenIdGenerator::RandomTokenIdGenerator(const std::size_t num_bytes,
                                               const TokenEncoding encoding)
    : num_bytes_(num_bytes), encoding_(encoding) {
  if (num_bytes_ == 0) {
    throw std::invalid_argument("RandomTokenIdGenerator: token length must be at least 1 byte");
  }
}

std::string RandomTokenIdGenerator::next(const std::string_view prefix) {
  const auto token = generate_secure_token(num_bytes_, encoding_);
  if (!token.has_value()) {
    // Unreachable after constructor validation; surfaced rather than masked.
    throw std::logic_error("RandomTokenIdGenerator: " + token.error());
  }
  return join_prefixed(prefix, token.value());
}

}  // namespace flakeid::core
