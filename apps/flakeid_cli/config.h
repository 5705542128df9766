#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::cli {

// Environment variable consulted when --machine-id is not given.
inline constexpr const char* kMachineIdEnvVar = "FLAKEID_MACHINE_ID";

// Upper bound on --count; a single run never needs to block for more than a few seconds.
inline constexpr std::size_t kMaxCount = 1'000'000;

enum class OutputFormat {
  kBase62,   // NOLINT(readability-identifier-naming)
  kDecimal,  // NOLINT(readability-identifier-naming)
  kJson,     // NOLINT(readability-identifier-naming)
};

// MachineIdSource records where the machine number came from, for startup diagnostics.
// kFlag:        --machine-id on the command line
// kEnvironment: FLAKEID_MACHINE_ID
// kRandom:      neither was set; a number is drawn at random at startup
enum class MachineIdSource {
  kFlag,         // NOLINT(readability-identifier-naming)
  kEnvironment,  // NOLINT(readability-identifier-naming)
  kRandom,       // NOLINT(readability-identifier-naming)
};

// CliConfig holds raw startup flags. Values are kept as given and validated by
// validate_cli_config() so that every problem is reported before any output.
struct CliConfig {
  std::optional<std::string> machine_id;                        // NOLINT(readability-identifier-naming)
  MachineIdSource machine_id_source{MachineIdSource::kRandom};  // NOLINT(readability-identifier-naming)
  std::string count{"1"};                                       // NOLINT(readability-identifier-naming)
  std::string format{"base62"};                                 // NOLINT(readability-identifier-naming)
  bool padded{false};                                           // NOLINT(readability-identifier-naming)
  bool show_help{false};                                        // NOLINT(readability-identifier-naming)
};

CliConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// apply_machine_id_env fills machine_id from env_value when no flag was given.
// env_value may be nullptr (variable unset); an empty value counts as unset.
void apply_machine_id_env(CliConfig& config, const char* env_value);

// usage_text lists every accepted flag with its description.
[[nodiscard]] std::string usage_text();

// Value parsers shared by the startup guard and main.
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view text);
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text);

[[nodiscard]] std::string to_string(MachineIdSource source);

}  // namespace flakeid::cli
