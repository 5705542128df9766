#include "flakeid/core/ids.h"

#include "flakeid/core/base62.h"

#include <cstdint>

namespace flakeid::core {

Result<ObjectKey, IdError> new_object_key(IIdGenerator& gen) {
  const auto id = gen.next_id();
  if (!id.has_value()) {
    return Result<ObjectKey, IdError>::err(id.error());
  }
  return Result<ObjectKey, IdError>::ok(
      ObjectKey{encode_base62(static_cast<std::uint64_t>(id.value()))});
}

Result<ObjectKey, IdError> new_sortable_object_key(IIdGenerator& gen) {
  const auto id = gen.next_id();
  if (!id.has_value()) {
    return Result<ObjectKey, IdError>::err(id.error());
  }
  return Result<ObjectKey, IdError>::ok(
      ObjectKey{encode_base62_padded(static_cast<std::uint64_t>(id.value()))});
}

}  // namespace flakeid::core
