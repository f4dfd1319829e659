#pragma once

#include "flakeid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeid::core {

// TokenEncoding selects the text form of a random token.
// kBase64Url: RFC 4648 section 5 alphabet, no '=' padding (4 chars per 3 bytes, rounded up)
// kHex      : lower-case hexadecimal (2 chars per byte)
enum class TokenEncoding {
  kBase64Url,
  kHex,
};

constexpr std::size_t kDefaultTokenBytes = 32;

// parse_token_encoding maps "base64url" / "hex" to a TokenEncoding.
[[nodiscard]] std::optional<TokenEncoding> parse_token_encoding(std::string_view name);

// secure_random_bytes draws `count` bytes from the system entropy source.
[[nodiscard]] std::vector<std::uint8_t> secure_random_bytes(std::size_t count);

[[nodiscard]] std::string encode_base64url(const std::vector<std::uint8_t>& bytes);
[[nodiscard]] std::string encode_hex(const std::vector<std::uint8_t>& bytes);

// generate_secure_token returns an opaque, unordered token of `num_bytes` random bytes.
// Tokens carry no timestamp or worker information and make no ordering claim.
// Returns an error string if num_bytes is 0.
[[nodiscard]] Result<std::string, std::string> generate_secure_token(
    std::size_t num_bytes = kDefaultTokenBytes, TokenEncoding encoding = TokenEncoding::kBase64Url);

}  // namespace flakeid::core
