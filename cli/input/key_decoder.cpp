#include "input/key_decoder.h"

#include "util/utf8.h"

namespace jnav::cli {

namespace {

size_t utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 1;
}

KeyChord csi_final_key(char final_byte, const std::string& params) {
  switch (final_byte) {
    case 'A':
      return key(KeyCode::Up);
    case 'B':
      return key(KeyCode::Down);
    case 'C':
      return key(KeyCode::Right);
    case 'D':
      return key(KeyCode::Left);
    case 'H':
      return key(KeyCode::Home);
    case 'F':
      return key(KeyCode::End);
    case 'Z':
      return key(KeyCode::BackTab);
    case '~':
      if (params == "1" || params == "7") return key(KeyCode::Home);
      if (params == "4" || params == "8") return key(KeyCode::End);
      if (params == "3") return key(KeyCode::Delete);
      break;
    default:
      break;
  }
  return key(KeyCode::None);
}

}  // namespace

void KeyDecoder::feed(const char* data, size_t size) {
  buffer_.append(data, size);
}

bool KeyDecoder::next(KeyChord& out, bool flush) {
  if (buffer_.empty()) return false;
  const unsigned char c = static_cast<unsigned char>(buffer_[0]);

  if (c == 0x1b) return decode_escape(out, flush);
  if (c == '\r') {
    out = key(KeyCode::Enter);
    consume(1);
    return true;
  }
  if (c == '\t') {
    out = key(KeyCode::Tab);
    consume(1);
    return true;
  }
  if (c == 0x7f) {
    out = key(KeyCode::Backspace);
    consume(1);
    return true;
  }
  if (c >= 0x01 && c <= 0x1a) {
    out = ctrl(static_cast<char>('a' + c - 1));
    consume(1);
    return true;
  }
  if (c < 0x20) {
    out = key(KeyCode::None);
    consume(1);
    return true;
  }

  if (buffer_.size() < utf8_sequence_length(c) && !flush) return false;
  size_t bytes = 0;
  uint32_t cp = util::decode_utf8(buffer_, 0, &bytes);
  out = KeyChord{KeyCode::Char, cp, kModNone};
  consume(bytes ? bytes : 1);
  return true;
}

bool KeyDecoder::decode_escape(KeyChord& out, bool flush) {
  if (buffer_.size() == 1) {
    if (!flush) return false;
    out = key(KeyCode::Escape);
    consume(1);
    return true;
  }
  const char second = buffer_[1];
  if (second == '[' || second == 'O') {
    size_t i = 2;
    std::string params;
    while (i < buffer_.size()) {
      unsigned char b = static_cast<unsigned char>(buffer_[i]);
      if (b >= 0x40 && b <= 0x7e) {
        // Modified arrows such as ESC[1;5C keep their base key.
        out = csi_final_key(static_cast<char>(b), params);
        consume(i + 1);
        return true;
      }
      params.push_back(static_cast<char>(b));
      ++i;
    }
    if (!flush) return false;
    out = key(KeyCode::None);
    consume(buffer_.size());
    return true;
  }
  if (second == 0x1b) {
    out = key(KeyCode::Escape);
    consume(1);
    return true;
  }
  const unsigned char b = static_cast<unsigned char>(second);
  if (b >= 0x20 && b < 0x7f) {
    out = alt(second);
    consume(2);
    return true;
  }
  out = key(KeyCode::Escape);
  consume(1);
  return true;
}

void KeyDecoder::consume(size_t bytes) {
  buffer_.erase(0, bytes);
}

}  // namespace jnav::cli
