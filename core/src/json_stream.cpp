#include "jnav/json_stream.h"

#include <cstddef>
#include <utility>

namespace jnav {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_structural(char c) {
  return c == '{' || c == '}' || c == '[' || c == ']' || c == '"' || c == ',' || c == ':';
}

size_t skip_string(const std::string& text, size_t pos) {
  // pos points at the opening quote.
  size_t i = pos + 1;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '"') return i + 1;
    ++i;
  }
  return text.size();
}

}  // namespace

JsonStreamReader::JsonStreamReader(std::string text) : text_(std::move(text)) {
  // A UTF-8 byte order mark is not part of the first value.
  if (text_.size() >= 3 && static_cast<unsigned char>(text_[0]) == 0xEF &&
      static_cast<unsigned char>(text_[1]) == 0xBB && static_cast<unsigned char>(text_[2]) == 0xBF) {
    pos_ = 3;
  }
}

size_t JsonStreamReader::value_end(size_t start) const {
  char first = text_[start];
  if (first == '"') return skip_string(text_, start);
  if (first == '{' || first == '[') {
    int depth = 0;
    size_t i = start;
    while (i < text_.size()) {
      char c = text_[i];
      if (c == '"') {
        i = skip_string(text_, i);
        continue;
      }
      if (c == '{' || c == '[') {
        ++depth;
      } else if (c == '}' || c == ']') {
        --depth;
        if (depth == 0) return i + 1;
      }
      ++i;
    }
    return text_.size();
  }
  if (is_structural(first)) return start + 1;
  size_t i = start;
  while (i < text_.size() && !is_space(text_[i]) && !is_structural(text_[i])) ++i;
  return i;
}

bool JsonStreamReader::next(Json& out, std::optional<DocumentError>& error) {
  error.reset();
  while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
  if (pos_ >= text_.size()) return false;

  const size_t start = pos_;
  const size_t end = value_end(start);
  pos_ = end;
  const size_t index = index_++;
  try {
    out = Json::parse(text_.begin() + static_cast<std::ptrdiff_t>(start),
                      text_.begin() + static_cast<std::ptrdiff_t>(end));
  } catch (const Json::parse_error& ex) {
    error = DocumentError{index, start, ex.what()};
    pos_ = resync_after_error(start, end, ex.byte);
  }
  return true;
}

size_t JsonStreamReader::resync_after_error(size_t start, size_t end, size_t error_byte) const {
  // Unbalanced brackets stretch a span past its line; resume at the first newline after the
  // failure instead, but never beyond the span itself.
  size_t failed_at = start + (error_byte > 0 ? error_byte - 1 : 0);
  if (failed_at >= end) return end;
  size_t newline = text_.find('\n', failed_at);
  if (newline == std::string::npos || newline >= end) return end;
  return newline > start ? newline : start + 1;
}

StreamReadResult read_json_documents(std::string text, std::optional<size_t> max_streams) {
  StreamReadResult result;
  JsonStreamReader reader(std::move(text));
  Json value;
  std::optional<DocumentError> error;
  while (!max_streams.has_value() || reader.documents_seen() < *max_streams) {
    if (!reader.next(value, error)) break;
    if (error.has_value()) {
      result.errors.push_back(std::move(*error));
      continue;
    }
    result.documents.push_back(std::move(value));
  }
  if (result.documents.empty()) {
    if (!result.errors.empty()) {
      throw InputError("Failed to parse JSON input: " + result.errors.front().message);
    }
    throw InputError("No JSON value found in input");
  }
  return result;
}

}  // namespace jnav
