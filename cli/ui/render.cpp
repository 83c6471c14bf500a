#include "ui/render.h"

#include <algorithm>

#include "input/text_util.h"
#include "ui/color.h"

namespace jnav::cli {

namespace {

struct RowParts {
  std::string indent;
  std::string label;
  std::string value;
};

std::string container_text(const TreeNode& node) {
  const bool is_object = node.kind == NodeKind::Object;
  if (node.length == 0) return is_object ? "{}" : "[]";
  if (node.expanded) return is_object ? "{" : "[";
  return is_object ? "{…}" : "[…]";
}

RowParts split_row(const JsonTree& tree, const FlatRow& row, size_t indent) {
  RowParts parts;
  parts.indent.assign(indent * static_cast<size_t>(std::max(row.depth, 0)), ' ');
  if (row.kind == RowKind::Truncated) {
    parts.value = "… " + std::to_string(row.omitted) + " more items";
    return parts;
  }
  const TreeNode& node = tree.node(row.node_id);
  if (node.member == MemberKind::ObjectMember) {
    parts.label = Json(node.key).dump(-1, ' ', false, Json::error_handler_t::replace) + ": ";
  } else if (node.member == MemberKind::ArrayElement) {
    parts.label = std::to_string(node.index) + ": ";
  }
  parts.value = is_container(node.kind) ? container_text(node) : node.scalar;
  return parts;
}

const char* value_style(const JsonTree& tree, const FlatRow& row) {
  if (row.kind == RowKind::Truncated) return kColor.dim;
  switch (tree.node(row.node_id).kind) {
    case NodeKind::String:
      return kColor.green;
    case NodeKind::Number:
      return kColor.cyan;
    case NodeKind::Boolean:
      return kColor.yellow;
    case NodeKind::Null:
      return kColor.dim;
    case NodeKind::Object:
    case NodeKind::Array:
      return kColor.bold;
  }
  return "";
}

const char* hint_style(HintLevel level) {
  switch (level) {
    case HintLevel::Info:
      return kColor.green;
    case HintLevel::Warning:
      return kColor.yellow;
    case HintLevel::Error:
      return kColor.red;
  }
  return "";
}

std::string paint(const std::string& text, const char* style, bool color) {
  if (!color || text.empty()) return text;
  return std::string(style) + text + kColor.reset;
}

std::string render_row(const JsonTree& tree, const FlatRow& row, size_t indent, size_t width,
                       bool selected, bool color) {
  RowParts parts = split_row(tree, row, indent);
  std::string plain = parts.indent + parts.label + parts.value;
  if (!color) return truncate_display_width(plain, width);
  if (selected) {
    return std::string(kColor.reverse) + pad_display_width(plain, width) + kColor.reset;
  }
  const std::string head = parts.indent + parts.label;
  const size_t head_width = column_width(head, 0, head.size());
  if (head_width >= width) {
    return paint(truncate_display_width(plain, width), kColor.blue, true);
  }
  return parts.indent + paint(parts.label, kColor.blue, true) +
         paint(truncate_display_width(parts.value, width - head_width), value_style(tree, row),
               true);
}

std::string render_prompt(const Navigator& navigator, size_t width, bool color,
                          size_t& cursor_column) {
  const char* spinner = navigator.spinner_frame();
  std::string lead = spinner != nullptr ? std::string(spinner) + " " : std::string(kPrompt);
  const size_t lead_width = column_width(lead, 0, lead.size());
  const std::string& text = navigator.buffer().text();
  const size_t before_cursor = column_width(text, 0, navigator.buffer().cursor());
  cursor_column = std::min(lead_width + before_cursor, width == 0 ? 0 : width - 1);
  std::string line = truncate_display_width(lead + text, width);
  if (!color) return line;
  const std::string body = truncate_display_width(text, width > lead_width ? width - lead_width : 0);
  return paint(lead, spinner != nullptr ? kColor.magenta : kColor.blue, true) + body;
}

}  // namespace

std::string format_row(const JsonTree& tree, const FlatRow& row, size_t indent) {
  RowParts parts = split_row(tree, row, indent);
  return parts.indent + parts.label + parts.value;
}

Frame render_frame(const Navigator& navigator, const RenderOptions& options) {
  const ViewportSize& viewport = navigator.viewport();
  const EngineConfig& config = navigator.config();
  const size_t width = viewport.columns;
  Frame frame;
  frame.lines.reserve(viewport.rows);

  frame.lines.push_back(render_prompt(navigator, width, options.color, frame.cursor_column));
  frame.cursor_row = 0;

  const SuggestionList& suggestions = navigator.suggestions();
  const bool suggesting = navigator.focus() == FocusMode::Suggesting && !suggestions.empty();
  const ViewWindow suggestion_window = suggesting ? suggestions.window() : ViewWindow{};
  for (size_t i = 0; i < config.suggestion_lines; ++i) {
    const size_t item = suggestion_window.begin + i;
    if (!suggesting || item >= suggestion_window.end) {
      frame.lines.emplace_back();
      continue;
    }
    const std::string label = "  " + suggestions.items()[item].label;
    if (item == suggestions.active()) {
      frame.lines.push_back(options.color ? std::string(kColor.reverse) +
                                                pad_display_width(label, width) + kColor.reset
                                          : truncate_display_width(label, width));
    } else {
      frame.lines.push_back(paint(truncate_display_width(label, width), kColor.dim, options.color));
    }
  }

  if (!config.no_hint) {
    const auto& hint = navigator.hint();
    if (hint.has_value()) {
      frame.lines.push_back(
          paint(truncate_display_width(hint->text, width), hint_style(hint->level), options.color));
    } else {
      frame.lines.emplace_back();
    }
  }

  const ViewWindow window = navigator.window();
  const auto& rows = navigator.rows();
  for (size_t row = window.begin; row < window.end && row < rows.size(); ++row) {
    if (frame.lines.size() >= viewport.rows) break;
    frame.lines.push_back(render_row(navigator.tree(), rows[row], config.indent, width,
                                     row == window.cursor, options.color));
  }
  while (frame.lines.size() < viewport.rows) frame.lines.emplace_back();
  if (frame.lines.size() > viewport.rows) frame.lines.resize(viewport.rows);
  return frame;
}

void write_frame(const Frame& frame, std::string& out) {
  out += "\x1b[?25l\x1b[H";
  for (size_t i = 0; i < frame.lines.size(); ++i) {
    out += frame.lines[i];
    out += "\x1b[K";
    if (i + 1 < frame.lines.size()) out += "\r\n";
  }
  out += "\x1b[" + std::to_string(frame.cursor_row + 1) + ";" +
         std::to_string(frame.cursor_column + 1) + "H";
  out += "\x1b[?25h";
}

}  // namespace jnav::cli
