#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

#include "jnav/config.h"

namespace jnav {

/// Owns the query text and a byte cursor that always sits on a UTF-8 boundary.
/// Every operation is total: motions and deletions clamp at the buffer edges.
/// `revision()` increments whenever the text changes and is the edit generation
/// the reactivity layer keys evaluations on.
class TextBuffer {
 public:
  explicit TextBuffer(const std::string& word_break_chars = ".|()[]",
                      EditMode mode = EditMode::Insert);

  const std::string& text() const { return text_; }
  size_t cursor() const { return cursor_; }
  EditMode mode() const { return mode_; }
  uint64_t revision() const { return revision_; }

  void set_mode(EditMode mode) { mode_ = mode; }
  void set_word_break_chars(const std::string& chars);

  /// Inserts one codepoint at the cursor, or replaces the codepoint under it in
  /// overwrite mode (appending when the cursor is at the end).
  void insert(uint32_t cp);
  /// Inserts a UTF-8 string codepoint by codepoint using the current mode.
  void insert_text(const std::string& utf8);
  /// Deletes the codepoint before the cursor.
  void erase();
  void erase_all();
  /// Replaces the whole text and parks the cursor at the end.
  void replace(const std::string& text);

  void move_left();
  void move_right();
  void move_to_head();
  void move_to_tail();
  void move_to_previous_boundary();
  void move_to_next_boundary();
  /// Removes the span between the previous boundary and the cursor.
  /// MUST leave the cursor at the boundary position.
  void erase_to_previous_boundary();
  /// Removes the span between the cursor and the next boundary.
  void erase_to_next_boundary();

  /// Largest word boundary strictly before the cursor (0 at the head).
  size_t previous_boundary() const;
  /// Smallest word boundary strictly after the cursor (text size at the tail).
  size_t next_boundary() const;

 private:
  bool is_break(uint32_t cp) const;
  bool is_boundary(size_t pos) const;
  void erase_range(size_t start, size_t end);

  std::string text_;
  size_t cursor_ = 0;
  EditMode mode_ = EditMode::Insert;
  uint64_t revision_ = 0;
  std::unordered_set<uint32_t> break_chars_;
};

}  // namespace jnav
