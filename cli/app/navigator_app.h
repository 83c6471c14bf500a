#pragma once

#include <iosfwd>
#include <vector>

#include "cli_args.h"
#include "jnav/json_value.h"

namespace jnav::cli {

/// Runs the full-screen navigator over already parsed documents until Ctrl-C.
/// MUST restore the terminal on every exit path. Returns the process exit code.
int run_navigator_app(std::vector<Json> documents, const CliOptions& options, std::ostream& err);

}  // namespace jnav::cli
