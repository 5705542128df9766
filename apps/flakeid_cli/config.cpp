#include "config.h"

#include "shared/arg_parser.h"

#include <string>
#include <vector>

namespace flakeid::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_machine_id(CliConfig& config, const std::string& value) {
  config.machine_id = value;
  config.machine_id_source = MachineIdSource::kFlag;
  return true;
}

bool handle_count(CliConfig& config, const std::string& value) {
  config.count = value;
  return true;
}

bool handle_format(CliConfig& config, const std::string& value) {
  config.format = value;
  return true;
}

bool handle_padded(CliConfig& config, const std::string& /*value*/) {
  config.padded = true;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--machine-id", true,
       "Machine number in [0, 1023]; must be unique among running instances (env: "
       "FLAKEID_MACHINE_ID)",
       handle_machine_id},
      {"--count", true, "Number of identifiers to mint (default 1)", handle_count},
      {"--format", true, "Output format (base62|decimal|json, default base62)", handle_format},
      {"--padded", false, "Pad base-62 keys to 11 characters so they sort lexicographically",
       handle_padded},
      {"--help", false, "Show this message", handle_help},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

CliConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options(argc, argv, build_option_registry());
}

void apply_machine_id_env(CliConfig& config, const char* env_value) {
  if (config.machine_id.has_value()) {
    return;  // flag wins
  }
  if (env_value == nullptr || env_value[0] == '\0') {
    return;
  }
  config.machine_id = std::string{env_value};
  config.machine_id_source = MachineIdSource::kEnvironment;
}

std::string usage_text() {
  return apps::format_usage("flakeid_cli", build_option_registry());
}

std::optional<std::size_t> parse_count(const std::string_view text) {
  if (text.empty() || text.size() > 7) {
    return std::nullopt;
  }

  std::size_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::size_t>(c - '0');
  }

  if (value == 0 || value > kMaxCount) {
    return std::nullopt;
  }
  return value;
}

std::optional<OutputFormat> parse_output_format(const std::string_view text) {
  if (text == "base62") {
    return OutputFormat::kBase62;
  }
  if (text == "decimal") {
    return OutputFormat::kDecimal;
  }
  if (text == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

std::string to_string(const MachineIdSource source) {
  switch (source) {
    case MachineIdSource::kFlag:
      return "--machine-id";
    case MachineIdSource::kEnvironment:
      return kMachineIdEnvVar;
    case MachineIdSource::kRandom:
      return "random";
  }
  return "unknown";
}

}  // namespace flakeid::cli
