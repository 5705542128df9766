#include "flakeid/core/result.h"

namespace flakeid::core {

std::string to_string(const IdError error) {
  switch (error) {
    case IdError::kInvalidMachineId:
      return "invalid machine id (must be in [0, 1023])";
    case IdError::kClockRegression:
      return "clock moved backwards; refusing to issue an identifier";
    case IdError::kTimestampOutOfRange:
      return "clock reading outside the 41-bit timestamp range of the epoch";
  }
  return "unknown id error";
}

}  // namespace flakeid::core
