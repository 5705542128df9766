#include "flakeid/core/machine_id.h"

#include "flakeid/core/id_generator.h"

#include <random>

namespace flakeid::core {

int random_machine_id() {
  std::random_device rd;
  std::uniform_int_distribution<int> dist(0, layout::kMaxMachineId);
  return dist(rd);
}

std::optional<int> parse_machine_id(const std::string_view text) {
  // Longer than "1023" cannot be valid; also bounds the accumulator below.
  if (text.empty() || text.size() > 4) {
    return std::nullopt;
  }

  int value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }

  if (value > layout::kMaxMachineId) {
    return std::nullopt;
  }
  return value;
}

}  // namespace flakeid::core
