#include "jnav/completion.h"

#include <cctype>

#include "util/string_util.h"

namespace jnav {

namespace {

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_integer_text(const std::string& text) {
  size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
  // Longer values would overflow int64 and cannot index a real array anyway.
  if (start >= text.size() || text.size() - start > 18) return false;
  for (size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

bool is_digits(const std::string& text) {
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Returns the index of the closing quote for the string opened at `open`, or npos.
size_t find_closing_quote(const std::string& text, size_t open) {
  size_t i = open + 1;
  while (i < text.size()) {
    if (text[i] == '\\') {
      i += 2;
      continue;
    }
    if (text[i] == '"') return i;
    ++i;
  }
  return std::string::npos;
}

bool decode_quoted(const std::string& literal, std::string& out) {
  Json decoded = Json::parse(literal, nullptr, false);
  if (decoded.is_discarded() || !decoded.is_string()) return false;
  out = decoded.get<std::string>();
  return true;
}

PathPrefix make_partial(const std::string& text, size_t step_start, PathPrefix::Partial kind,
                        std::string partial_text, std::vector<PathStep> steps) {
  PathPrefix out;
  out.valid = true;
  out.steps = std::move(steps);
  out.complete_text = text.substr(0, step_start);
  out.partial = kind;
  out.partial_text = std::move(partial_text);
  return out;
}

}  // namespace

PathPrefix parse_path_prefix(const std::string& text) {
  PathPrefix invalid;
  if (text.empty()) return make_partial(text, 0, PathPrefix::Partial::Key, "", {});
  if (text[0] != '.') return invalid;

  std::vector<PathStep> steps;
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '.') {
      const size_t step_start = i;
      ++i;
      if (i >= text.size()) {
        return make_partial(text, step_start, PathPrefix::Partial::Key, "", std::move(steps));
      }
      const char d = text[i];
      if (is_ident_start(d)) {
        size_t j = i;
        while (j < text.size() && is_ident_char(text[j])) ++j;
        std::string name = text.substr(i, j - i);
        if (j >= text.size()) {
          return make_partial(text, step_start, PathPrefix::Partial::Key, name, std::move(steps));
        }
        steps.push_back(PathStep{PathStep::Kind::Key, name, 0});
        i = j;
        continue;
      }
      if (d == '"') {
        size_t close = find_closing_quote(text, i);
        if (close == std::string::npos) {
          std::string partial;
          if (!decode_quoted(text.substr(i) + "\"", partial)) partial = text.substr(i + 1);
          return make_partial(text, step_start, PathPrefix::Partial::Key, partial, std::move(steps));
        }
        std::string key;
        if (!decode_quoted(text.substr(i, close - i + 1), key)) return invalid;
        steps.push_back(PathStep{PathStep::Kind::Key, key, 0});
        i = close + 1;
        continue;
      }
      if (d == '[') continue;
      return invalid;
    }
    if (c == '[') {
      const size_t open = i;
      size_t j = i + 1;
      while (j < text.size() && text[j] != ']') {
        if (text[j] == '"') {
          j = find_closing_quote(text, j);
          if (j == std::string::npos) break;
        }
        ++j;
      }
      if (j == std::string::npos || j >= text.size()) {
        std::string content = util::trim_ws(text.substr(open + 1));
        if (!is_digits(content)) return invalid;
        return make_partial(text, open, PathPrefix::Partial::Index, content, std::move(steps));
      }
      std::string content = util::trim_ws(text.substr(open + 1, j - open - 1));
      if (content.empty()) {
        steps.push_back(PathStep{PathStep::Kind::Iterate, "", 0});
      } else if (is_integer_text(content)) {
        steps.push_back(PathStep{PathStep::Kind::Index, "", std::stoll(content)});
      } else if (content.front() == '"') {
        std::string key;
        if (!decode_quoted(content, key)) return invalid;
        steps.push_back(PathStep{PathStep::Kind::Key, key, 0});
      } else {
        return invalid;
      }
      i = j + 1;
      continue;
    }
    if (c == '?') {
      ++i;
      continue;
    }
    return invalid;
  }

  PathPrefix out;
  out.valid = true;
  out.steps = std::move(steps);
  out.complete_text = text;
  return out;
}

}  // namespace jnav
