#include "test_harness.h"

#include <vector>

#include "jnav/json_stream.h"

namespace {

void test_reads_concatenated_documents() {
  auto result = jnav::read_json_documents("{\"a\":1}{\"b\":2} [3]\n\"s\" 4 true null", std::nullopt);
  expect_eq(result.documents.size(), 7, "seven top-level values");
  expect_true(result.errors.empty(), "no errors");
  expect_true(result.documents[1]["b"] == 2, "second document parsed");
  expect_true(result.documents[3] == "s", "string document");
  expect_true(result.documents[6].is_null(), "null document");
}

void test_reads_ndjson_lines() {
  auto result = jnav::read_json_documents("{\"n\":1}\n{\"n\":2}\r\n{\"n\":3}\n", std::nullopt);
  expect_eq(result.documents.size(), 3, "one document per line");
  expect_true(result.documents[2]["n"] == 3, "last line parsed");
}

void test_brackets_inside_strings_are_ignored() {
  auto result = jnav::read_json_documents(R"({"a":"}{ \"]"} [1])", std::nullopt);
  expect_eq(result.documents.size(), 2, "string contents do not split values");
  expect_true(result.documents[0]["a"] == "}{ \"]", "escaped quote kept in string");
}

void test_max_streams_limits_documents() {
  auto result = jnav::read_json_documents("1 2 3 4", std::size_t{2});
  expect_eq(result.documents.size(), 2, "stops after two documents");
}

void test_malformed_document_is_skipped() {
  auto result = jnav::read_json_documents("{\"a\":1} {\"b\":} {\"c\":3}", std::nullopt);
  expect_eq(result.documents.size(), 2, "good documents kept");
  expect_eq(result.errors.size(), 1, "one error recorded");
  expect_eq(result.errors[0].index, 1, "error carries the document index");
  expect_eq(result.errors[0].offset, 8, "error carries the byte offset");
  expect_true(result.documents[1]["c"] == 3, "reading continues after the error");
}

void test_unbalanced_document_does_not_swallow_following_lines() {
  auto result = jnav::read_json_documents("{\"a\":[1}\n{\"b\":2}\n{\"c\":3}\n", std::nullopt);
  expect_eq(result.documents.size(), 2, "lines after the bad one are read");
  expect_eq(result.errors.size(), 1, "only the bad line is reported");
  expect_eq(result.errors[0].index, 0, "first document is the bad one");
  expect_true(result.documents[0]["b"] == 2, "second line parsed");
  expect_true(result.documents[1]["c"] == 3, "third line parsed");

  auto after_good = jnav::read_json_documents("{\"ok\":0}\n{\"a\":[1}\n{\"b\":2}", std::nullopt);
  expect_eq(after_good.documents.size(), 2, "documents on both sides of the bad line kept");
  expect_eq(after_good.errors.size(), 1, "one error between good documents");
  expect_eq(after_good.errors[0].offset, 9, "error points at the bad line");
  expect_true(after_good.documents[1]["b"] == 2, "document after the bad line parsed");
}

void test_byte_order_mark_skipped() {
  auto result = jnav::read_json_documents("\xEF\xBB\xBF{\"k\":true}", std::nullopt);
  expect_eq(result.documents.size(), 1, "bom before first value");
  expect_true(result.documents[0]["k"] == true, "value parsed");
}

void test_empty_input_throws() {
  bool thrown = false;
  try {
    (void)jnav::read_json_documents("  \n ", std::nullopt);
  } catch (const jnav::InputError& ex) {
    thrown = std::string(ex.what()).find("No JSON value") != std::string::npos;
  }
  expect_true(thrown, "whitespace-only input is an input error");
}

void test_all_malformed_throws() {
  bool thrown = false;
  try {
    (void)jnav::read_json_documents("{oops}", std::nullopt);
  } catch (const jnav::InputError& ex) {
    thrown = std::string(ex.what()).find("Failed to parse JSON input") != std::string::npos;
  }
  expect_true(thrown, "input without any valid document is an input error");
}

void test_reader_reports_end() {
  jnav::JsonStreamReader reader("[1] ");
  jnav::Json value;
  std::optional<jnav::DocumentError> error;
  expect_true(reader.next(value, error), "first value available");
  expect_true(!error.has_value(), "first value parsed");
  expect_true(!reader.next(value, error), "end of input after trailing whitespace");
  expect_eq(reader.documents_seen(), 1, "one document seen");
}

}  // namespace

void register_json_stream_tests(std::vector<TestCase>& tests) {
  tests.push_back({"reads_concatenated_documents", test_reads_concatenated_documents});
  tests.push_back({"reads_ndjson_lines", test_reads_ndjson_lines});
  tests.push_back({"brackets_inside_strings_are_ignored", test_brackets_inside_strings_are_ignored});
  tests.push_back({"max_streams_limits_documents", test_max_streams_limits_documents});
  tests.push_back({"malformed_document_is_skipped", test_malformed_document_is_skipped});
  tests.push_back({"unbalanced_document_does_not_swallow_following_lines",
                   test_unbalanced_document_does_not_swallow_following_lines});
  tests.push_back({"byte_order_mark_skipped", test_byte_order_mark_skipped});
  tests.push_back({"empty_input_throws", test_empty_input_throws});
  tests.push_back({"all_malformed_throws", test_all_malformed_throws});
  tests.push_back({"reader_reports_end", test_reader_reports_end});
}
