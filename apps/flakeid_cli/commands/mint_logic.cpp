#include "mint_logic.h"

#include "flakeid/core/base62.h"
#include "flakeid/core/ids.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace flakeid::cli {

namespace {

std::string render_key(const std::int64_t id, const bool padded) {
  const auto value = static_cast<std::uint64_t>(id);
  return padded ? core::encode_base62_padded(value) : core::encode_base62(value);
}

void report_failure(std::ostream& err, const std::size_t index, const core::IdError error) {
  err << "Error: allocation " << (index + 1) << " failed: " << core::to_string(error) << "\n";
}

}  // namespace

int execute_mint(core::IIdGenerator& gen, const MintRequest& request, std::ostream& out,
                 std::ostream& err) {
  switch (request.format) {
    case OutputFormat::kBase62: {
      for (std::size_t i = 0; i < request.count; ++i) {
        const auto key = request.padded ? core::new_sortable_object_key(gen)
                                        : core::new_object_key(gen);
        if (!key.has_value()) {
          report_failure(err, i, key.error());
          return 2;
        }
        out << key.value().value << "\n";
      }
      return 0;
    }

    case OutputFormat::kDecimal: {
      for (std::size_t i = 0; i < request.count; ++i) {
        const auto id = gen.next_id();
        if (!id.has_value()) {
          report_failure(err, i, id.error());
          return 2;
        }
        out << id.value() << "\n";
      }
      return 0;
    }

    case OutputFormat::kJson: {
      nlohmann::json doc;
      doc["machine_id"] = request.machine_id;
      doc["epoch_ms"] = core::layout::kEpochMillis;
      doc["ids"] = nlohmann::json::array();

      for (std::size_t i = 0; i < request.count; ++i) {
        const auto id = gen.next_id();
        if (!id.has_value()) {
          report_failure(err, i, id.error());
          return 2;
        }
        doc["ids"].push_back({
            {"id", std::to_string(id.value())},
            {"key", render_key(id.value(), request.padded)},
        });
      }

      out << doc.dump(2) << "\n";
      return 0;
    }
  }
  return 0;
}

}  // namespace flakeid::cli
