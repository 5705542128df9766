#pragma once

#include "config.h"
#include <string>

namespace flakeid::cli {

// validate_cli_config checks startup preconditions for the CLI.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - if machine_id is present, parse_machine_id() must succeed (decimal, 0..1023)
// - count must be a decimal integer in [1, kMaxCount]
// - format must be one of base62, decimal, json
// - --padded is only meaningful with base62 or json output
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace flakeid::cli
