#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "jnav/json_tree.h"
#include "jnav/navigator.h"

namespace jnav::cli {

/// One full screen: lines top to bottom plus where the text cursor belongs.
struct Frame {
  std::vector<std::string> lines;
  size_t cursor_row = 0;
  size_t cursor_column = 0;
};

struct RenderOptions {
  bool color = true;
};

constexpr const char* kPrompt = "❯❯ ";

/// Formats one viewer row without styling: indentation, `key: ` / `index: ` prefix
/// and the value, `{…}` / `[…]` when collapsed, `{` / `[` when expanded.
std::string format_row(const JsonTree& tree, const FlatRow& row, size_t indent);

/// Lays out prompt, suggestion lines, hint line and viewer window for the navigator.
/// MUST produce exactly viewport().rows lines, each at most viewport().columns wide.
Frame render_frame(const Navigator& navigator, const RenderOptions& options);

/// Writes a frame over the previous one without clearing the screen first.
void write_frame(const Frame& frame, std::string& out);

}  // namespace jnav::cli
