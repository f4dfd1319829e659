#pragma once

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Production code reads system time; tests drive a ManualClock so that generator
// behaviour around millisecond boundaries is deterministic.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds elapsed since 1970-01-01T00:00:00Z.
  // Contract: safe to call concurrently from multiple threads.
  [[nodiscard]] virtual std::int64_t now_unix_millis() const = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
// The wall clock can move backward (NTP step, VM migration); callers must handle that.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  [[nodiscard]] std::int64_t now_unix_millis() const override;
};

// Manual clock: returns whatever the owner last set. Time only moves when set() or
// advance() is called, which lets tests hold a millisecond fixed or step it backward.
// Thread-safe: a test thread may advance the clock while a generator thread waits on it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_unix_millis) : now_(start_unix_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  [[nodiscard]] std::int64_t now_unix_millis() const override;

  void set(std::int64_t unix_millis);
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> now_;
};

}  // namespace flakeid::core
