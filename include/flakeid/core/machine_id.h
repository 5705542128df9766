#pragma once

#include <optional>
#include <string_view>

namespace flakeid::core {

// random_machine_id draws a machine number uniformly from [0, layout::kMaxMachineId].
// Only suitable when a collision between concurrently running instances is an
// acceptable risk; deployments that need a guarantee must assign numbers explicitly.
[[nodiscard]] int random_machine_id();

// parse_machine_id accepts plain decimal text in [0, layout::kMaxMachineId].
// Rejects: empty input, signs, whitespace, non-digits, out-of-range values.
[[nodiscard]] std::optional<int> parse_machine_id(std::string_view text);

}  // namespace flakeid::core
