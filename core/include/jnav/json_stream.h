#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "jnav/json_value.h"

namespace jnav {

/// A top-level document that failed to parse; later documents are still read.
struct DocumentError {
  size_t index = 0;
  size_t offset = 0;
  std::string message;
};

struct StreamReadResult {
  std::vector<Json> documents;
  std::vector<DocumentError> errors;
};

/// Thrown when the input yields no usable document at all.
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

/// Splits a byte buffer into successive top-level JSON values.
/// Values may be separated by any whitespace (NDJSON, concatenated JSON).
class JsonStreamReader {
 public:
  explicit JsonStreamReader(std::string text);

  /// Parses the next top-level value into `out`.
  /// Returns false at end of input. A malformed value sets `error` and still returns true
  /// so the caller can record it and continue with the following value.
  bool next(Json& out, std::optional<DocumentError>& error);

  size_t documents_seen() const { return index_; }

 private:
  size_t value_end(size_t start) const;
  /// Position to continue from after the span [start, end) failed to parse at `error_byte`.
  size_t resync_after_error(size_t start, size_t end, size_t error_byte) const;

  std::string text_;
  size_t pos_ = 0;
  size_t index_ = 0;
};

/// Reads every document, stopping after `max_streams` values when set.
/// MUST throw InputError when no document parsed successfully.
StreamReadResult read_json_documents(std::string text, std::optional<size_t> max_streams);

}  // namespace jnav
