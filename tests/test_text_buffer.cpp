#include "test_harness.h"

#include <vector>

#include "jnav/text_buffer.h"

namespace {

void test_insert_advances_cursor_and_revision() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".ab");
  expect_str_eq(buffer.text(), ".ab", "insert_text appends");
  expect_eq(buffer.cursor(), 3, "cursor after insert");
  expect_eq(buffer.revision(), 3, "one revision per inserted codepoint");
}

void test_insert_in_middle() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".ac");
  buffer.move_left();
  buffer.insert('b');
  expect_str_eq(buffer.text(), ".abc", "insert lands at cursor");
  expect_eq(buffer.cursor(), 3, "cursor moves past inserted char");
}

void test_overwrite_mode_replaces_codepoint() {
  jnav::TextBuffer buffer(".|()[]", jnav::EditMode::Overwrite);
  buffer.insert_text(".abc");
  buffer.move_to_head();
  buffer.move_right();
  buffer.insert('x');
  expect_str_eq(buffer.text(), ".xbc", "overwrite replaces the char under the cursor");
  buffer.move_to_tail();
  buffer.insert('d');
  expect_str_eq(buffer.text(), ".xbcd", "overwrite at end appends");
}

void test_overwrite_multibyte_replaced_whole() {
  jnav::TextBuffer buffer(".|()[]", jnav::EditMode::Overwrite);
  buffer.insert_text("a\xC3\xA9z");
  buffer.move_to_head();
  buffer.move_right();
  buffer.insert('e');
  expect_str_eq(buffer.text(), "aez", "two-byte codepoint replaced by one byte");
}

void test_erase_at_head_is_noop() {
  jnav::TextBuffer buffer;
  buffer.insert_text("ab");
  buffer.move_to_head();
  uint64_t before = buffer.revision();
  buffer.erase();
  expect_str_eq(buffer.text(), "ab", "erase at head keeps text");
  expect_eq(buffer.revision(), before, "erase at head does not bump revision");
}

void test_erase_removes_whole_codepoint() {
  jnav::TextBuffer buffer;
  buffer.insert_text("x\xE2\x82\xAC");
  buffer.erase();
  expect_str_eq(buffer.text(), "x", "erase removes the three-byte euro sign");
  expect_eq(buffer.cursor(), 1, "cursor stays on a boundary");
}

void test_moves_clamp_at_edges() {
  jnav::TextBuffer buffer;
  buffer.insert_text("ab");
  buffer.move_right();
  expect_eq(buffer.cursor(), 2, "move_right clamps at tail");
  buffer.move_to_head();
  buffer.move_left();
  expect_eq(buffer.cursor(), 0, "move_left clamps at head");
}

void test_cursor_moves_by_codepoint() {
  jnav::TextBuffer buffer;
  buffer.insert_text("\xE3\x81\x82\xE3\x81\x84");
  buffer.move_left();
  expect_eq(buffer.cursor(), 3, "move_left steps over one three-byte codepoint");
  buffer.move_left();
  expect_eq(buffer.cursor(), 0, "second move_left reaches head");
}

void test_previous_boundary_motion() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".foo.bar");
  expect_eq(buffer.previous_boundary(), 5, "boundary after the last dot");
  buffer.move_to_previous_boundary();
  expect_eq(buffer.cursor(), 5, "cursor parks on boundary");
  buffer.move_to_previous_boundary();
  expect_eq(buffer.cursor(), 4, "dot itself is a word");
  buffer.move_to_previous_boundary();
  expect_eq(buffer.cursor(), 1, "start of foo");
  buffer.move_to_previous_boundary();
  buffer.move_to_previous_boundary();
  expect_eq(buffer.cursor(), 0, "clamps at head");
}

void test_next_boundary_motion() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".foo[0]");
  buffer.move_to_head();
  buffer.move_to_next_boundary();
  expect_eq(buffer.cursor(), 1, "after leading dot");
  buffer.move_to_next_boundary();
  expect_eq(buffer.cursor(), 4, "end of foo");
  buffer.move_to_tail();
  buffer.move_to_next_boundary();
  expect_eq(buffer.cursor(), 7, "clamps at tail");
}

void test_erase_previous_word() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".items.name");
  buffer.erase_to_previous_boundary();
  expect_str_eq(buffer.text(), ".items.", "erases the last word");
  expect_eq(buffer.cursor(), 7, "cursor at boundary");
  buffer.erase_to_previous_boundary();
  expect_str_eq(buffer.text(), ".items", "erases the dot run");
}

void test_erase_next_word() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".a.bcd");
  buffer.move_to_head();
  buffer.move_right();
  buffer.move_right();
  buffer.move_right();
  buffer.erase_to_next_boundary();
  expect_str_eq(buffer.text(), ".a.", "erases to end of word");
  expect_eq(buffer.cursor(), 3, "cursor unchanged");
}

void test_custom_word_break_chars() {
  jnav::TextBuffer buffer("-");
  buffer.insert_text("ab.cd-ef");
  expect_eq(buffer.previous_boundary(), 6, "only '-' breaks words");
  buffer.set_word_break_chars(".");
  expect_eq(buffer.previous_boundary(), 3, "break set can be changed");
}

void test_replace_moves_cursor_to_end() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".b[");
  uint64_t before = buffer.revision();
  buffer.replace(".b[0]");
  expect_str_eq(buffer.text(), ".b[0]", "replace sets text");
  expect_eq(buffer.cursor(), 5, "replace parks cursor at end");
  expect_eq(buffer.revision(), before + 1, "replace bumps revision once");
  buffer.move_to_head();
  buffer.replace(".b[0]");
  expect_eq(buffer.revision(), before + 1, "identical replace keeps revision");
  expect_eq(buffer.cursor(), 5, "identical replace still moves cursor");
}

void test_erase_all() {
  jnav::TextBuffer buffer;
  buffer.insert_text(".x");
  buffer.erase_all();
  expect_true(buffer.text().empty(), "erase_all clears");
  expect_eq(buffer.cursor(), 0, "cursor at head");
}

}  // namespace

void register_text_buffer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"insert_advances_cursor_and_revision", test_insert_advances_cursor_and_revision});
  tests.push_back({"insert_in_middle", test_insert_in_middle});
  tests.push_back({"overwrite_mode_replaces_codepoint", test_overwrite_mode_replaces_codepoint});
  tests.push_back({"overwrite_multibyte_replaced_whole", test_overwrite_multibyte_replaced_whole});
  tests.push_back({"erase_at_head_is_noop", test_erase_at_head_is_noop});
  tests.push_back({"erase_removes_whole_codepoint", test_erase_removes_whole_codepoint});
  tests.push_back({"moves_clamp_at_edges", test_moves_clamp_at_edges});
  tests.push_back({"cursor_moves_by_codepoint", test_cursor_moves_by_codepoint});
  tests.push_back({"previous_boundary_motion", test_previous_boundary_motion});
  tests.push_back({"next_boundary_motion", test_next_boundary_motion});
  tests.push_back({"erase_previous_word", test_erase_previous_word});
  tests.push_back({"erase_next_word", test_erase_next_word});
  tests.push_back({"custom_word_break_chars", test_custom_word_break_chars});
  tests.push_back({"replace_moves_cursor_to_end", test_replace_moves_cursor_to_end});
  tests.push_back({"erase_all", test_erase_all});
}
