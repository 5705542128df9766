#include "flakeid/core/id_generator.h"

#include <thread>

namespace flakeid::core {

Result<std::shared_ptr<SnowflakeGenerator>, IdError> SnowflakeGenerator::create(
    const int machine_id, IClock& clock) {
  if (machine_id < 0 || machine_id > layout::kMaxMachineId) {
    return Result<std::shared_ptr<SnowflakeGenerator>, IdError>::err(IdError::kInvalidMachineId);
  }
  return Result<std::shared_ptr<SnowflakeGenerator>, IdError>::ok(
      std::shared_ptr<SnowflakeGenerator>(new SnowflakeGenerator(machine_id, clock)));
}

SnowflakeGenerator::SnowflakeGenerator(const int machine_id, IClock& clock)
    : machine_id_(machine_id), clock_(clock) {}

Result<std::int64_t, IdError> SnowflakeGenerator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t timestamp = clock_.now_unix_millis();
  if (timestamp < last_timestamp_) {
    return Result<std::int64_t, IdError>::err(IdError::kClockRegression);
  }

  const std::int64_t delta = timestamp - layout::kEpochMillis;
  if (delta < 0 || delta > layout::kMaxTimestampDelta) {
    return Result<std::int64_t, IdError>::err(IdError::kTimestampOutOfRange);
  }

  // State is only written once every check has passed.
  std::int64_t sequence = 0;
  if (timestamp == last_timestamp_) {
    sequence = (sequence_ + 1) & layout::kMaxSequence;
    if (sequence == 0) {
      // 4096 ids already issued this millisecond; block for the next one.
      timestamp = wait_next_millis();
      if (timestamp - layout::kEpochMillis > layout::kMaxTimestampDelta) {
        return Result<std::int64_t, IdError>::err(IdError::kTimestampOutOfRange);
      }
    }
  }

  sequence_ = sequence;
  last_timestamp_ = timestamp;

  const std::int64_t id = ((timestamp - layout::kEpochMillis) << layout::kTimestampShift) |
                          (static_cast<std::int64_t>(machine_id_) << layout::kMachineIdShift) |
                          sequence;
  return Result<std::int64_t, IdError>::ok(id);
}

std::int64_t SnowflakeGenerator::wait_next_millis() {
  std::int64_t timestamp = clock_.now_unix_millis();
  while (timestamp <= last_timestamp_) {
    std::this_thread::yield();
    timestamp = clock_.now_unix_millis();
  }
  return timestamp;
}

}  // namespace flakeid::core
