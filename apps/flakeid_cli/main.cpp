#include "flakeid/core/clock.h"
#include "flakeid/core/id_generator.h"
#include "flakeid/core/machine_id.h"
#include "flakeid/core/time.h"
#include "flakeid/core/version.h"

#include "commands/mint_logic.h"
#include "config.h"
#include "startup_guard.h"
#include <cstdlib>
#include <iostream>

using namespace flakeid;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = cli::parse_args(argc, argv);
  cli::apply_machine_id_env(config, std::getenv(cli::kMachineIdEnvVar));

  if (config.show_help) {
    std::cout << cli::usage_text();
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = cli::validate_cli_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // Config was validated above; every parse below is guaranteed to succeed.
  const int machine_id = config.machine_id.has_value()
                             ? core::parse_machine_id(config.machine_id.value()).value()
                             : core::random_machine_id();

  // ── Startup diagnostic block (stderr; stdout carries identifiers only) ──
  std::cerr << "flakeid v" << core::kBuildVersion << "\n";
  std::cerr << "Machine ID:  " << machine_id << " (" << cli::to_string(config.machine_id_source)
            << ")\n";
  if (config.machine_id_source == cli::MachineIdSource::kRandom) {
    std::cerr << "WARNING: No --machine-id or " << cli::kMachineIdEnvVar
              << " given. Using a RANDOM machine number.\n"
                 "         Identifiers may collide with any other instance that draws the same\n"
                 "         number. Assign a unique --machine-id per running instance.\n";
  }
  std::cerr << "Epoch:       " << core::format_iso8601_utc(core::layout::kEpochMillis) << "\n";
  // ─────────────────────────────────────────────────────────────────────────

  // Composition root: one clock and one generator for the lifetime of the process.
  core::SystemClock clock;
  auto gen_result = core::SnowflakeGenerator::create(machine_id, clock);
  if (!gen_result.has_value()) {
    std::cerr << "Error: " << core::to_string(gen_result.error()) << "\n";
    return 1;
  }
  core::SnowflakeGenerator& gen = *gen_result.value();

  const cli::MintRequest request{
      .count = cli::parse_count(config.count).value(),
      .format = cli::parse_output_format(config.format).value(),
      .padded = config.padded,
      .machine_id = gen.machine_id(),
  };

  return cli::execute_mint(gen, request, std::cout, std::cerr);
}
