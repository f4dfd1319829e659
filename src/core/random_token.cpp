#include "flakeid/core/random_token.h"

#include <random>

namespace flakeid::core {

std::optional<TokenEncoding> parse_token_encoding(const std::string_view name) {
  if (name == "base64url") {
    return TokenEncoding::kBase64Url;
  }
  if (name == "hex") {
    return TokenEncoding::kHex;
  }
  return std::nullopt;
}

std::vector<std::uint8_t> secure_random_bytes(const std::size_t count) {
  // One device per thread: std::random_device reads the OS entropy pool and is not
  // guaranteed safe for concurrent use of a single instance.
  static thread_local std::random_device device;

  std::vector<std::uint8_t> bytes;
  bytes.reserve(count);
  while (bytes.size() < count) {
    auto word = device();
    for (std::size_t i = 0; i < sizeof(word) && bytes.size() < count; ++i) {
      bytes.push_back(static_cast<std::uint8_t>(word & 0xFFu));
      word >>= 8;
    }
  }
  return bytes;
}

std::string encode_base64url(const std::vector<std::uint8_t>& bytes) {
  constexpr const char* kAlphabet =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

  std::string out;
  out.reserve((bytes.size() * 4 + 2) / 3);

  std::size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3) {
    const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                (static_cast<std::uint32_t>(bytes[i + 1]) << 8) | bytes[i + 2];
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
    out.push_back(kAlphabet[chunk & 0x3F]);
  }

  const std::size_t remaining = bytes.size() - i;
  if (remaining == 1) {
    const std::uint32_t chunk = static_cast<std::uint32_t>(bytes[i]) << 16;
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
  } else if (remaining == 2) {
    const std::uint32_t chunk =
        (static_cast<std::uint32_t>(bytes[i]) << 16) | (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
  }

  return out;
}

std::string encode_hex(const std::vector<std::uint8_t>& bytes) {
  constexpr const char* kDigits = "0123456789abcdef";

  std::string out;
  out.reserve(bytes.size() * 2);
  for (const std::uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

Result<std::string, std::string> generate_secure_token(const std::size_t num_bytes,
                                                       const TokenEncoding encoding) {
  if (num_bytes == 0) {
    return Result<std::string, std::string>::err("token length must be at least 1 byte");
  }

  const auto bytes = secure_random_bytes(num_bytes);
  switch (encoding) {
    case TokenEncoding::kBase64Url:
      return Result<std::string, std::string>::ok(encode_base64url(bytes));
    case TokenEncoding::kHex:
      return Result<std::string, std::string>::ok(encode_hex(bytes));
  }
  return Result<std::string, std::string>::err("unsupported token encoding");
}

}  // namespace flakeid::core
