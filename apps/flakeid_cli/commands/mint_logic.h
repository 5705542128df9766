#pragma once

#include "flakeid/core/id_generator.h"

#include "config.h"
#include <cstddef>
#include <ostream>

namespace flakeid::cli {

struct MintRequest {
  std::size_t count{1};                        // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kBase62};  // NOLINT(readability-identifier-naming)
  bool padded{false};                          // NOLINT(readability-identifier-naming)
  int machine_id{0};                           // NOLINT(readability-identifier-naming)
};

// execute_mint allocates request.count identifiers from gen and writes them to out.
//
// base62 / decimal: one identifier per line.
// json: {"machine_id": N, "epoch_ms": E, "ids": [{"id": "<decimal>", "key": "<base62>"}, ...]}
//       id is a string so 63-bit values survive JSON readers that use doubles.
//
// Returns 0 on success. On the first allocation failure, writes the error to err,
// writes nothing further to out and returns 2. Lines already written stay written
// for line formats; json output is all-or-nothing.
int execute_mint(core::IIdGenerator& gen, const MintRequest& request, std::ostream& out,
                 std::ostream& err);

}  // namespace flakeid::cli
