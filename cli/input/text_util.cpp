#include "input/text_util.h"

#include <algorithm>

#include "util/utf8.h"

namespace jnav::cli {

int display_width(uint32_t cp) {
  if (cp == 0) return 0;
  if (cp < 0x20 || (cp >= 0x7f && cp < 0xa0)) return 0;
  if ((cp >= 0x0300 && cp <= 0x036f) || (cp >= 0x200b && cp <= 0x200f) ||
      (cp >= 0xfe00 && cp <= 0xfe0f)) {
    return 0;
  }
  if ((cp >= 0x1100 && cp <= 0x115f) || (cp >= 0x2e80 && cp <= 0xa4cf) ||
      (cp >= 0xac00 && cp <= 0xd7a3) || (cp >= 0xf900 && cp <= 0xfaff) ||
      (cp >= 0xfe30 && cp <= 0xfe4f) || (cp >= 0xff00 && cp <= 0xff60) ||
      (cp >= 0xffe0 && cp <= 0xffe6) || (cp >= 0x1f300 && cp <= 0x1faff) ||
      (cp >= 0x20000 && cp <= 0x3fffd)) {
    return 2;
  }
  return 1;
}

size_t column_width(const std::string& text, size_t start, size_t end) {
  size_t width = 0;
  size_t i = start;
  end = std::min(end, text.size());
  while (i < end) {
    size_t bytes = 0;
    uint32_t cp = util::decode_utf8(text, i, &bytes);
    width += static_cast<size_t>(std::max(display_width(cp), 0));
    i += bytes ? bytes : 1;
  }
  return width;
}

std::string truncate_display_width(const std::string& text, size_t width) {
  if (width == 0) return "";
  if (column_width(text, 0, text.size()) <= width) return text;
  const size_t content_limit = width - 1;
  size_t i = 0;
  size_t used = 0;
  while (i < text.size()) {
    size_t bytes = 0;
    uint32_t cp = util::decode_utf8(text, i, &bytes);
    size_t cp_width = static_cast<size_t>(std::max(display_width(cp), 0));
    if (used + cp_width > content_limit) break;
    used += cp_width;
    i += bytes ? bytes : 1;
  }
  return text.substr(0, i) + "…";
}

std::string pad_display_width(const std::string& text, size_t width) {
  std::string out = truncate_display_width(text, width);
  size_t used = column_width(out, 0, out.size());
  if (used < width) out.append(width - used, ' ');
  return out;
}

}  // namespace jnav::cli
