#include <exception>
#include <iostream>
#include <string>

#include "app/navigator_app.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "jnav/json_stream.h"
#include "jnav/version.h"
#include "ui/color.h"

using namespace jnav::cli;

namespace {

void print_diagnostic(std::ostream& os, bool color, const char* style, const char* label,
                      const std::string& message) {
  if (color) os << style;
  os << label;
  if (color) os << kColor.reset;
  os << message << "\n";
}

}  // namespace

/// Entry point that parses CLI options, loads the input documents and runs the navigator.
/// MUST preserve exit codes: 0 success, 1 input/runtime error, 2 CLI usage error.
int main(int argc, char** argv) {
  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    print_diagnostic(std::cerr, options.color, kColor.red, "Error: ", arg_error);
    std::cerr << "Try 'jnav --help' for usage.\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "jnav " << jnav::version_string() << std::endl;
    return 0;
  }

  jnav::StreamReadResult loaded;
  try {
    loaded = jnav::read_json_documents(read_input(options.input), options.config.max_streams);
  } catch (const std::exception& ex) {
    print_diagnostic(std::cerr, options.color, kColor.red, "Error: ", ex.what());
    return 1;
  }
  for (const auto& skipped : loaded.errors) {
    print_diagnostic(std::cerr, options.color, kColor.yellow, "Warning: ",
                     "skipped document " + std::to_string(skipped.index) + " at byte " +
                         std::to_string(skipped.offset) + ": " + skipped.message);
  }

  try {
    return run_navigator_app(std::move(loaded.documents), options, std::cerr);
  } catch (const std::exception& ex) {
    print_diagnostic(std::cerr, options.color, kColor.red, "Error: ", ex.what());
    return 1;
  }
}
