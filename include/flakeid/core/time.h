#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// format_iso8601_utc renders a Unix-millisecond timestamp as ISO 8601 UTC with
// millisecond precision, e.g. "2010-11-04T01:42:54.657Z".
// Negative inputs (before 1970) are rendered as well; sub-second digits are never negative.
[[nodiscard]] std::string format_iso8601_utc(std::int64_t unix_millis);

}  // namespace flakeid::core
