#include "jnav/text_buffer.h"

#include "util/utf8.h"

namespace jnav {

TextBuffer::TextBuffer(const std::string& word_break_chars, EditMode mode) : mode_(mode) {
  set_word_break_chars(word_break_chars);
}

void TextBuffer::set_word_break_chars(const std::string& chars) {
  break_chars_.clear();
  size_t i = 0;
  while (i < chars.size()) {
    size_t bytes = 0;
    break_chars_.insert(util::decode_utf8(chars, i, &bytes));
    i += bytes ? bytes : 1;
  }
}

void TextBuffer::insert(uint32_t cp) {
  std::string encoded = util::encode_utf8(cp);
  if (mode_ == EditMode::Overwrite && cursor_ < text_.size()) {
    size_t end = util::next_codepoint_start(text_, cursor_);
    text_.replace(cursor_, end - cursor_, encoded);
  } else {
    text_.insert(cursor_, encoded);
  }
  cursor_ += encoded.size();
  ++revision_;
}

void TextBuffer::insert_text(const std::string& utf8) {
  size_t i = 0;
  while (i < utf8.size()) {
    size_t bytes = 0;
    uint32_t cp = util::decode_utf8(utf8, i, &bytes);
    insert(cp);
    i += bytes ? bytes : 1;
  }
}

void TextBuffer::erase() {
  if (cursor_ == 0) return;
  erase_range(util::prev_codepoint_start(text_, cursor_), cursor_);
}

void TextBuffer::erase_all() {
  if (text_.empty()) return;
  text_.clear();
  cursor_ = 0;
  ++revision_;
}

void TextBuffer::replace(const std::string& text) {
  cursor_ = text.size();
  if (text == text_) return;
  text_ = text;
  ++revision_;
}

void TextBuffer::move_left() {
  cursor_ = util::prev_codepoint_start(text_, cursor_);
}

void TextBuffer::move_right() {
  cursor_ = util::next_codepoint_start(text_, cursor_);
}

void TextBuffer::move_to_head() {
  cursor_ = 0;
}

void TextBuffer::move_to_tail() {
  cursor_ = text_.size();
}

void TextBuffer::move_to_previous_boundary() {
  cursor_ = previous_boundary();
}

void TextBuffer::move_to_next_boundary() {
  cursor_ = next_boundary();
}

void TextBuffer::erase_to_previous_boundary() {
  erase_range(previous_boundary(), cursor_);
}

void TextBuffer::erase_to_next_boundary() {
  size_t end = next_boundary();
  size_t start = cursor_;
  erase_range(start, end);
}

size_t TextBuffer::previous_boundary() const {
  size_t pos = cursor_;
  while (pos > 0) {
    pos = util::prev_codepoint_start(text_, pos);
    if (is_boundary(pos)) return pos;
  }
  return 0;
}

size_t TextBuffer::next_boundary() const {
  size_t pos = cursor_;
  while (pos < text_.size()) {
    pos = util::next_codepoint_start(text_, pos);
    if (is_boundary(pos)) return pos;
  }
  return text_.size();
}

bool TextBuffer::is_break(uint32_t cp) const {
  return break_chars_.find(cp) != break_chars_.end();
}

bool TextBuffer::is_boundary(size_t pos) const {
  if (pos == 0 || pos >= text_.size()) return true;
  size_t prev = util::prev_codepoint_start(text_, pos);
  uint32_t before = util::decode_utf8(text_, prev, nullptr);
  uint32_t after = util::decode_utf8(text_, pos, nullptr);
  return is_break(before) != is_break(after);
}

void TextBuffer::erase_range(size_t start, size_t end) {
  if (end <= start) return;
  text_.erase(start, end - start);
  cursor_ = start;
  ++revision_;
}

}  // namespace jnav
