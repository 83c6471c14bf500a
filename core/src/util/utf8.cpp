#include "util/utf8.h"

namespace jnav::util {

namespace {

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

uint32_t decode_utf8(const std::string& text, size_t pos, size_t* bytes) {
  if (pos >= text.size()) {
    if (bytes) *bytes = 0;
    return 0;
  }
  unsigned char c0 = static_cast<unsigned char>(text[pos]);
  size_t len = 1;
  uint32_t cp = c0;
  if (c0 >= 0xF0 && c0 <= 0xF4) {
    len = 4;
    cp = c0 & 0x07;
  } else if (c0 >= 0xE0 && c0 <= 0xEF) {
    len = 3;
    cp = c0 & 0x0F;
  } else if (c0 >= 0xC2 && c0 <= 0xDF) {
    len = 2;
    cp = c0 & 0x1F;
  } else if (c0 >= 0x80) {
    if (bytes) *bytes = 1;
    return 0xFFFD;
  }
  if (len == 1) {
    if (bytes) *bytes = 1;
    return cp;
  }
  if (pos + len > text.size()) {
    if (bytes) *bytes = 1;
    return 0xFFFD;
  }
  for (size_t i = 1; i < len; ++i) {
    unsigned char c = static_cast<unsigned char>(text[pos + i]);
    if (!is_continuation(c)) {
      if (bytes) *bytes = 1;
      return 0xFFFD;
    }
    cp = (cp << 6) | (c & 0x3F);
  }
  if (bytes) *bytes = len;
  return cp;
}

size_t next_codepoint_start(const std::string& text, size_t pos) {
  if (pos >= text.size()) return text.size();
  size_t bytes = 0;
  decode_utf8(text, pos, &bytes);
  size_t next = pos + (bytes ? bytes : 1);
  return next > text.size() ? text.size() : next;
}

size_t prev_codepoint_start(const std::string& text, size_t pos) {
  if (pos == 0 || text.empty()) return 0;
  if (pos > text.size()) pos = text.size();
  size_t i = pos - 1;
  while (i > 0 && is_continuation(static_cast<unsigned char>(text[i]))) --i;
  return i;
}

std::string encode_utf8(uint32_t cp) {
  std::string out;
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

}  // namespace jnav::util
