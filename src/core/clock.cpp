#include "flakeid/core/clock.h"

#include "flakeid/core/time.h"

namespace flakeid::core {

std::int64_t SystemClock::now_unix_millis() const {
  return to_unix_millis(now_utc());
}

std::int64_t ManualClock::now_unix_millis() const {
  return now_.load(std::memory_order_acquire);
}

void ManualClock::set(const std::int64_t unix_millis) {
  now_.store(unix_millis, std::memory_order_release);
}

void ManualClock::advance(const std::int64_t delta_millis) {
  now_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace flakeid::core
