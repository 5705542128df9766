#include "flakeid/core/clock.h"

#include "flakeid/core/time.h"

namespace flakeid::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

std::int64_t FixedClock::now_unix_millis() {
  return fixed_millis_.load(std::memory_order_acquire);
}

void FixedClock::set(const std::int64_t millis) {
  fixed_millis_.store(millis, std::memory_order_release);
}

void FixedClock::advance(const std::int64_t delta_millis) {
  fixed_millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace flakeid::core
