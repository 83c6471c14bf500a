#include "jnav/config.h"

namespace jnav {

bool validate_engine_config(const EngineConfig& config, std::string& error) {
  if (config.search_result_chunk_size == 0) {
    error = "search_result_chunk_size must be greater than 0";
    return false;
  }
  if (config.search_load_chunk_size == 0) {
    error = "search_load_chunk_size must be greater than 0";
    return false;
  }
  if (config.suggestion_list_length == 0) {
    error = "suggestion list length must be greater than 0";
    return false;
  }
  if (config.indent == 0) {
    error = "indent must be greater than 0";
    return false;
  }
  if (config.max_streams.has_value() && *config.max_streams == 0) {
    error = "max_streams must be greater than 0";
    return false;
  }
  return true;
}

std::optional<EditMode> parse_edit_mode(const std::string& value) {
  if (value.empty() || value == "insert") return EditMode::Insert;
  if (value == "overwrite") return EditMode::Overwrite;
  return std::nullopt;
}

}  // namespace jnav
