#pragma once

#include <cstddef>
#include <string>

#include "jnav/keymap.h"

namespace jnav::cli {

/// Turns raw terminal bytes into key chords.
/// Bytes are buffered until a full UTF-8 codepoint or escape sequence is available.
class KeyDecoder {
 public:
  void feed(const char* data, size_t size);

  /// Decodes the next chord. Returns false when more bytes are needed.
  /// With `flush` set, a lone pending ESC is reported as Escape instead of waiting.
  bool next(KeyChord& out, bool flush = false);

  /// True when the buffer holds an ESC that may still start a sequence.
  bool pending_escape() const { return !buffer_.empty() && buffer_[0] == '\033'; }
  bool empty() const { return buffer_.empty(); }

 private:
  bool decode_escape(KeyChord& out, bool flush);
  void consume(size_t bytes);

  std::string buffer_;
};

}  // namespace jnav::cli
