#pragma once

#include <string>
#include <string_view>

namespace jnav::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
std::string to_lower(std::string_view s);
/// Trims leading and trailing ASCII whitespace.
std::string trim_ws(const std::string& s);
/// Returns true when `key` can follow a dot without quoting ([A-Za-z_][A-Za-z0-9_]*).
bool is_plain_identifier(std::string_view key);
/// Formats an object key as a path step: `.key` or `."quoted key"`.
std::string format_key_step(const std::string& key);
/// Quotes a string as a JSON string literal.
std::string quote_json_string(const std::string& text);

}  // namespace jnav::util
