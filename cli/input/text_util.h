#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace jnav::cli {

/// Returns terminal column width for a codepoint (0 for combining marks, 2 for wide CJK).
int display_width(uint32_t cp);
/// Sums display widths of the codepoints in [start, end).
size_t column_width(const std::string& text, size_t start, size_t end);
/// Cuts text to at most `width` columns, marking the cut with an ellipsis.
std::string truncate_display_width(const std::string& text, size_t width);
/// Truncates and right-pads with spaces to exactly `width` columns.
std::string pad_display_width(const std::string& text, size_t width);

}  // namespace jnav::cli
