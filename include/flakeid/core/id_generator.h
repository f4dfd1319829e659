#pragma once

#include "flakeid/core/random_token.h"
#include "flakeid/core/result.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace flakeid::core {

// Abstract string-ID generator for dependency injection.
// Produces application-facing identifiers of the form "<prefix>-<tail>", or just "<tail>"
// when the prefix is empty.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate next ID with given prefix.
  // Contract: returned ID is non-empty and starts with prefix.
  // Throws GenerationFailure if the underlying source cannot produce a tail.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// GenerationFailure carries a GenerationError across the string interface, which has no
// error channel of its own.
class GenerationFailure : public std::runtime_error {
 public:
  explicit GenerationFailure(GenerationError error)
      : std::runtime_error(error.message), error_(std::move(error)) {}

  [[nodiscard]] const GenerationError& error() const noexcept { return error_; }

 private:
  GenerationError error_;
};

// join_prefixed builds "<prefix>-<tail>", or "<tail>" for an empty prefix.
[[nodiscard]] std::string join_prefixed(std::string_view prefix, std::string_view tail);

// Random-token ID generator: prefix + secure random token. No ordering, no state.
// Thread-safe (entropy source is per-thread).
class RandomTokenIdGenerator final : public IIdGenerator {
 public:
  // Throws std::invalid_argument if num_bytes is 0.
  explicit RandomTokenIdGenerator(std::size_t num_bytes = kDefaultTokenBytes,
                                  TokenEncoding encoding = TokenEncoding::kBase64Url);
  ~RandomTokenIdGenerator() override = default;

  RandomTokenIdGenerator(const RandomTokenIdGenerator&) = default;
  RandomTokenIdGenerator& operator=(const RandomTokenIdGenerator&) = default;
  RandomTokenIdGenerator(RandomTokenIdGenerator&&) = default;
  RandomTokenIdGenerator& operator=(RandomTokenIdGenerator&&) = default;

  std::string next(std::string_view prefix) override;

 private:
  std::size_t num_bytes_;
  TokenEncoding encoding_;
};

}  // namespace flakeid::core
