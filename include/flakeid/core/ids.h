#pragma once

#include "flakeid/core/id_generator.h"
#include "flakeid/core/result.h"

#include <string>

namespace flakeid::core {

// Strong ID type following C++ Core Guidelines C.11 (Make concrete types regular).
// An ObjectKey is the base-62 rendering of one generated identifier and is used
// by collaborators as an opaque external key.
struct ObjectKey {
  std::string value;
  auto operator<=>(const ObjectKey&) const = default;
};

// new_object_key allocates one identifier and renders it as base 62.
// Propagates the generator's error unchanged.
[[nodiscard]] Result<ObjectKey, IdError> new_object_key(IIdGenerator& gen);

// Same as new_object_key, but fixed width (kBase62IdWidth) so keys sort
// lexicographically in allocation order.
[[nodiscard]] Result<ObjectKey, IdError> new_sortable_object_key(IIdGenerator& gen);

}  // namespace flakeid::core
