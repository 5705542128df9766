#include "startup_guard.h"

#include "flakeid/core/machine_id.h"

namespace flakeid::cli {

std::string validate_cli_config(const CliConfig& config) {
  // An unparsable machine number is an error, never a fallback to a random one.
  if (config.machine_id.has_value() &&
      !core::parse_machine_id(config.machine_id.value()).has_value()) {
    return "Error: machine id '" + config.machine_id.value() + "' (from " +
           to_string(config.machine_id_source) +
           ") is not valid.\n"
           "       Expected a decimal integer in [0, 1023].";
  }

  if (!parse_count(config.count).has_value()) {
    return "Error: --count '" + config.count + "' is not valid.\n" +
           "       Expected a decimal integer in [1, " + std::to_string(kMaxCount) + "].";
  }

  const auto format = parse_output_format(config.format);
  if (!format.has_value()) {
    return "Error: --format '" + config.format + "' is not valid (valid: base62, decimal, json).";
  }

  if (config.padded && format.value() == OutputFormat::kDecimal) {
    return "Error: --padded applies to base-62 keys and cannot be combined with --format decimal.";
  }

  return "";
}

}  // namespace flakeid::cli
