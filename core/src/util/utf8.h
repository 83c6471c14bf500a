#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace jnav::util {

/// Decodes one UTF-8 codepoint starting at byte `pos`.
/// MUST report at least one consumed byte for malformed input so callers always advance.
uint32_t decode_utf8(const std::string& text, size_t pos, size_t* bytes);

/// Returns the byte index of the codepoint that follows `pos`.
/// MUST clamp at text.size().
size_t next_codepoint_start(const std::string& text, size_t pos);

/// Returns the byte index of the codepoint that precedes `pos`.
/// MUST clamp at 0 and skip continuation bytes.
size_t prev_codepoint_start(const std::string& text, size_t pos);

/// Encodes a codepoint as UTF-8; invalid codepoints become U+FFFD.
std::string encode_utf8(uint32_t cp);

}  // namespace jnav::util
