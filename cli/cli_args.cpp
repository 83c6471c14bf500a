#include "cli_args.h"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <ostream>
#include <string>

namespace jnav::cli {

namespace {

bool parse_size(const std::string& text, size_t& out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  out = static_cast<size_t>(value);
  return true;
}

bool parse_int(const std::string& text, int& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (value < INT_MIN || value > INT_MAX) return false;
  out = static_cast<int>(value);
  return true;
}

bool take_value(int argc, char** argv, int& i, const std::string& flag, std::string& value,
                std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  value = argv[++i];
  return true;
}

bool take_size(int argc, char** argv, int& i, const std::string& flag, size_t& out,
               std::string& error) {
  std::string value;
  if (!take_value(argc, argv, i, flag, value, error)) return false;
  if (!parse_size(value, out)) {
    error = "Invalid " + flag + " value: " + value;
    return false;
  }
  return true;
}

bool take_millis(int argc, char** argv, int& i, const std::string& flag,
                 std::chrono::milliseconds& out, std::string& error) {
  size_t value = 0;
  if (!take_size(argc, argv, i, flag, value, error)) return false;
  out = std::chrono::milliseconds(static_cast<long long>(value));
  return true;
}

}  // namespace

void print_help(std::ostream& os) {
  os << "Usage: jnav [options] [input|-]\n";
  os << "Interactive JSON navigator with live filtering.\n\n";
  os << "Options:\n";
  os << "  --edit-mode insert|overwrite   How typed characters land in the query (default insert)\n";
  os << "  --indent N                     Spaces per tree level (default 2)\n";
  os << "  --no-hint                      Hide the hint line\n";
  os << "  --max-streams N                Read at most N JSON documents from the input\n";
  os << "  --suggestions N                Maximum completion candidates (default 100)\n";
  os << "  --expand-depth N               Expand nodes up to depth N at startup (-1 = all)\n";
  os << "  --limit-length N               Show at most N array elements per array (default 50)\n";
  os << "  --query-debounce-ms N          Delay before a typed query runs (default 600)\n";
  os << "  --resize-debounce-ms N         Delay before a terminal resize applies (default 200)\n";
  os << "  --spin-ms N                    Spinner frame interval (default 300)\n";
  os << "  --search-result-chunk-size N   Candidates scored per completion batch (default 100)\n";
  os << "  --search-load-chunk-size N     Keys collected per completion batch (default 50000)\n";
  os << "  --color=disabled               Disable ANSI colors\n";
  os << "  --version                      Print version and exit\n";
  os << "  --help                         Print this help and exit\n\n";
  os << "If input is omitted or '-', JSON is read from stdin and keys from /dev/tty.\n";
  os << "Keys: Tab complete, Enter fold/unfold, Up/Down move, Ctrl-N/Ctrl-P expand/collapse all,\n"
        "Ctrl-L/Ctrl-H first/last row, Ctrl-C quit.\n";
  os << "Exit codes: 0=success, 1=input/runtime error, 2=CLI usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  bool have_input = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "--edit-mode") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      auto mode = parse_edit_mode(value);
      if (!mode.has_value()) {
        error = "Invalid --edit-mode value (use insert|overwrite)";
        return false;
      }
      parsed.config.edit_mode = *mode;
    } else if (arg == "--indent") {
      if (!take_size(argc, argv, i, arg, parsed.config.indent, error)) return false;
    } else if (arg == "--no-hint") {
      parsed.config.no_hint = true;
    } else if (arg == "--max-streams") {
      size_t count = 0;
      if (!take_size(argc, argv, i, arg, count, error)) return false;
      parsed.config.max_streams = count;
    } else if (arg == "--suggestions") {
      if (!take_size(argc, argv, i, arg, parsed.config.suggestion_list_length, error)) {
        return false;
      }
    } else if (arg == "--expand-depth") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      if (!parse_int(value, parsed.config.expand_depth)) {
        error = "Invalid --expand-depth value: " + value;
        return false;
      }
    } else if (arg == "--limit-length") {
      if (!take_size(argc, argv, i, arg, parsed.config.limit_length, error)) return false;
    } else if (arg == "--query-debounce-ms") {
      if (!take_millis(argc, argv, i, arg, parsed.config.query_debounce, error)) return false;
    } else if (arg == "--resize-debounce-ms") {
      if (!take_millis(argc, argv, i, arg, parsed.config.resize_debounce, error)) return false;
    } else if (arg == "--spin-ms") {
      if (!take_millis(argc, argv, i, arg, parsed.config.spin_interval, error)) return false;
    } else if (arg == "--search-result-chunk-size") {
      if (!take_size(argc, argv, i, arg, parsed.config.search_result_chunk_size, error)) {
        return false;
      }
    } else if (arg == "--search-load-chunk-size") {
      if (!take_size(argc, argv, i, arg, parsed.config.search_load_chunk_size, error)) {
        return false;
      }
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg == "-" || arg.empty() || arg[0] != '-') {
      if (have_input) {
        error = "Only one input may be given (got '" + parsed.input + "' and '" + arg + "')";
        return false;
      }
      parsed.input = arg;
      have_input = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!parsed.show_help && !parsed.show_version &&
      !validate_engine_config(parsed.config, error)) {
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace jnav::cli
