#pragma once

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests drive time by hand.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time in milliseconds since the Unix epoch.
  // Contract: must be safe to call concurrently from multiple threads.
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// Fixed clock: returns a caller-controlled timestamp for deterministic tests.
// The value only changes through set() or advance(); it never ticks on its own.
// Thread-safe.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::int64_t now_unix_millis() override;

  void set(std::int64_t millis);
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> fixed_millis_;
};

}  // namespace flakeid::core
