#include "test_harness.h"

#include <sstream>
#include <vector>

#include "cli_args.h"

namespace {

bool parse(std::vector<const char*> args, jnav::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "jnav");
  int argc = static_cast<int>(args.size());
  return jnav::cli::parse_cli_args(argc, const_cast<char**>(args.data()), options, error);
}

void test_defaults_without_arguments() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(parse({}, options, error), "no arguments is valid");
  expect_true(options.input.empty(), "stdin by default");
  expect_true(options.color, "color on by default");
  expect_eq(options.config.limit_length, 50, "default limit length");
  expect_eq(static_cast<size_t>(options.config.query_debounce.count()), 600,
            "default query debounce");
}

void test_parse_all_engine_flags() {
  jnav::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--edit-mode", "overwrite", "--indent", "4", "--no-hint", "--max-streams",
                   "3", "--suggestions", "20", "--expand-depth", "2", "--limit-length", "10",
                   "--query-debounce-ms", "100", "--resize-debounce-ms", "50", "--spin-ms",
                   "80", "--search-result-chunk-size", "7", "--search-load-chunk-size", "9",
                   "--color=disabled", "data.json"},
                  options, error);
  expect_true(ok, "all flags accepted");
  expect_true(options.config.edit_mode == jnav::EditMode::Overwrite, "edit mode");
  expect_eq(options.config.indent, 4, "indent");
  expect_true(options.config.no_hint, "no hint");
  expect_true(options.config.max_streams.has_value() && *options.config.max_streams == 3,
              "max streams");
  expect_eq(options.config.suggestion_list_length, 20, "suggestions");
  expect_eq(static_cast<size_t>(options.config.expand_depth), 2, "expand depth");
  expect_eq(options.config.limit_length, 10, "limit length");
  expect_eq(static_cast<size_t>(options.config.query_debounce.count()), 100, "query debounce");
  expect_eq(static_cast<size_t>(options.config.resize_debounce.count()), 50, "resize debounce");
  expect_eq(static_cast<size_t>(options.config.spin_interval.count()), 80, "spin interval");
  expect_eq(options.config.search_result_chunk_size, 7, "result chunk");
  expect_eq(options.config.search_load_chunk_size, 9, "load chunk");
  expect_true(!options.color, "color disabled");
  expect_true(options.input == "data.json", "input path");
}

void test_negative_expand_depth_allowed() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--expand-depth", "-1"}, options, error), "negative depth accepted");
  expect_true(options.config.expand_depth == -1, "depth value");
}

void test_dash_means_stdin() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(parse({"-"}, options, error), "dash accepted");
  expect_true(options.input == "-", "dash recorded");
}

void test_rejects_missing_value() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--indent"}, options, error), "missing value rejected");
  expect_true(error.find("Missing value for --indent") != std::string::npos, "clear error");
}

void test_rejects_bad_numbers() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--limit-length", "ten"}, options, error), "non-numeric rejected");
  expect_true(error.find("Invalid --limit-length value") != std::string::npos, "names the flag");
  expect_true(!parse({"--suggestions", "-5"}, options, error), "negative size rejected");
  expect_true(!parse({"--indent", "0"}, options, error), "zero indent rejected");
  expect_true(error.find("indent") != std::string::npos, "validation message");
  expect_true(!parse({"--search-load-chunk-size", "0"}, options, error), "zero chunk rejected");
}

void test_rejects_bad_edit_mode() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--edit-mode", "replace"}, options, error), "unknown mode rejected");
  expect_true(error.find("insert|overwrite") != std::string::npos, "lists valid modes");
}

void test_rejects_unknown_flag_and_second_input() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--bogus"}, options, error), "unknown flag rejected");
  expect_true(error == "Unknown argument: --bogus", "unknown flag message");
  expect_true(!parse({"a.json", "b.json"}, options, error), "two inputs rejected");
}

void test_failed_parse_leaves_options_untouched() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--indent", "8", "--bogus"}, options, error), "parse fails");
  expect_eq(options.config.indent, 2, "earlier flags not applied");
}

void test_help_and_version() {
  jnav::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--help"}, options, error), "help accepted");
  expect_true(options.show_help, "help flag");
  jnav::cli::CliOptions version;
  expect_true(parse({"--version"}, version, error), "version accepted");
  expect_true(version.show_version, "version flag");
  std::ostringstream out;
  jnav::cli::print_help(out);
  expect_true(out.str().find("--search-load-chunk-size") != std::string::npos,
              "help lists flags");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"defaults_without_arguments", test_defaults_without_arguments});
  tests.push_back({"parse_all_engine_flags", test_parse_all_engine_flags});
  tests.push_back({"negative_expand_depth_allowed", test_negative_expand_depth_allowed});
  tests.push_back({"dash_means_stdin", test_dash_means_stdin});
  tests.push_back({"rejects_missing_value", test_rejects_missing_value});
  tests.push_back({"rejects_bad_numbers", test_rejects_bad_numbers});
  tests.push_back({"rejects_bad_edit_mode", test_rejects_bad_edit_mode});
  tests.push_back({"rejects_unknown_flag_and_second_input",
                   test_rejects_unknown_flag_and_second_input});
  tests.push_back({"failed_parse_leaves_options_untouched",
                   test_failed_parse_leaves_options_untouched});
  tests.push_back({"help_and_version", test_help_and_version});
}
