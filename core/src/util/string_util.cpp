#include "string_util.h"

#include <cctype>

#include <nlohmann/json.hpp>

namespace jnav::util {

namespace {

bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

bool is_ident_start(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) || c == '_';
}

bool is_ident_char(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_';
}

}  // namespace

std::string to_lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && is_space(static_cast<unsigned char>(s[start]))) ++start;
  size_t end = s.size();
  while (end > start && is_space(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

bool is_plain_identifier(std::string_view key) {
  if (key.empty() || !is_ident_start(key[0])) return false;
  for (char c : key) {
    if (!is_ident_char(c)) return false;
  }
  return true;
}

std::string format_key_step(const std::string& key) {
  if (is_plain_identifier(key)) return "." + key;
  return "." + quote_json_string(key);
}

std::string quote_json_string(const std::string& text) {
  return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace jnav::util
