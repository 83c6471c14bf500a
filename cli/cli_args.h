#pragma once

#include <iosfwd>
#include <string>

#include "jnav/config.h"

namespace jnav::cli {

struct CliOptions {
  /// Path to read; empty or "-" means stdin.
  std::string input;
  EngineConfig config;
  bool color = true;
  bool show_help = false;
  bool show_version = false;
};

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os);

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and MUST not mutate options on parse failure.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace jnav::cli
