#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace flakeid::core {

// Identifier layout, most significant first (bit 63 is always zero):
//   [41 bits timestamp delta ms][10 bits machine number][12 bits sequence]
namespace layout {

inline constexpr int kSequenceBits = 12;
inline constexpr int kMachineIdBits = 10;
inline constexpr int kTimestampBits = 41;

inline constexpr int kMachineIdShift = kSequenceBits;
inline constexpr int kTimestampShift = kSequenceBits + kMachineIdBits;

inline constexpr std::int64_t kMaxSequence = (std::int64_t{1} << kSequenceBits) - 1;
inline constexpr int kMaxMachineId = (1 << kMachineIdBits) - 1;
inline constexpr std::int64_t kMaxTimestampDelta = (std::int64_t{1} << kTimestampBits) - 1;

// Shared epoch: 2010-11-04T01:42:54.657Z. Every instance whose identifiers are
// ever compared must use this same value.
inline constexpr std::int64_t kEpochMillis = 1288834974657;

}  // namespace layout

// Abstract ID generator interface for dependency injection.
// Collaborators that mint keys depend on this, not on a concrete generator.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Allocate the next identifier.
  // Contract: on success the value is non-negative and never repeats for this instance.
  [[nodiscard]] virtual Result<std::int64_t, IdError> next_id() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// SnowflakeGenerator issues 63-bit, time-ordered identifiers for one machine number.
//
// Thread-safety: next_id() is linearizable. A single mutex covers the clock read,
// the (last_timestamp_, sequence_) update and the wait for the next millisecond
// when a millisecond's 4096 sequence values are exhausted.
//
// Failure: a clock reading below the last timestamp used returns kClockRegression
// and leaves state untouched; the caller decides whether to retry.
//
// Lifetime: created once by the composition root and passed by reference. The
// clock must outlive the generator.
class SnowflakeGenerator final : public IIdGenerator {
 public:
  // Validate machine_id against [0, layout::kMaxMachineId] and construct.
  [[nodiscard]] static Result<std::shared_ptr<SnowflakeGenerator>, IdError> create(int machine_id,
                                                                                   IClock& clock);

  ~SnowflakeGenerator() override = default;

  // Not copyable or movable (contains mutex)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] Result<std::int64_t, IdError> next_id() override;

  [[nodiscard]] int machine_id() const { return machine_id_; }

 private:
  SnowflakeGenerator(int machine_id, IClock& clock);

  // Spin until the clock reads past last_timestamp_. Caller holds mutex_.
  std::int64_t wait_next_millis();

  const int machine_id_;
  IClock& clock_;

  std::mutex mutex_;
  std::int64_t last_timestamp_{-1};  // -1: no identifier issued yet
  std::int64_t sequence_{0};
};

}  // namespace flakeid::core
