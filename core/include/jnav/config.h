#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace jnav {

/// How printable input lands in the query buffer.
enum class EditMode {
  Insert,
  Overwrite,
};

/// Tunables consumed by the navigation engine.
/// Built by the CLI layer; the engine treats every field as an opaque value.
struct EngineConfig {
  /// Non-root nodes at depth <= expand_depth start expanded. Negative expands everything.
  int expand_depth = -1;
  /// Arrays longer than this render `limit_length` children plus one summary row.
  size_t limit_length = 50;
  std::chrono::milliseconds query_debounce{600};
  std::chrono::milliseconds resize_debounce{200};
  std::chrono::milliseconds spin_interval{300};
  size_t suggestion_list_length = 100;
  size_t suggestion_lines = 3;
  size_t search_result_chunk_size = 100;
  size_t search_load_chunk_size = 50000;
  std::string word_break_chars = ".|()[]";
  EditMode edit_mode = EditMode::Insert;
  size_t indent = 2;
  std::optional<size_t> max_streams;
  bool no_hint = false;
  size_t result_cache_entries = 32;
};

/// Checks that sizes used as divisors or loop strides are usable.
/// MUST leave `error` untouched on success and return false with a message otherwise.
bool validate_engine_config(const EngineConfig& config, std::string& error);

/// Parses "insert" / "overwrite" (case-sensitive, empty means insert).
std::optional<EditMode> parse_edit_mode(const std::string& value);

}  // namespace jnav
