#include "flakeid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

std::string format_iso8601_utc(const std::int64_t unix_millis) {
  // Floor division keeps the millisecond part in [0, 999] for pre-1970 values.
  std::int64_t seconds = unix_millis / 1000;
  std::int64_t millis = unix_millis % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  std::tm tm_utc{};
  gmtime_r(&time_t_value, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
