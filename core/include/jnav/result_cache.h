#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "jnav/json_value.h"

namespace jnav {

using ResultValues = std::shared_ptr<const std::vector<Json>>;

/// Bounded cache of successful filter results keyed by exact query text.
/// Evicts the least recently used entry once `max_entries` is exceeded.
class ResultCache {
 public:
  explicit ResultCache(size_t max_entries);

  /// Returns the cached values and marks the entry as most recently used, or nullptr.
  ResultValues find(const std::string& query);
  void put(const std::string& query, ResultValues values);

  size_t size() const { return entries_.size(); }
  size_t max_entries() const { return max_entries_; }

 private:
  struct Entry {
    ResultValues values;
    std::list<std::string>::iterator position;
  };

  size_t max_entries_;
  std::unordered_map<std::string, Entry> entries_;
  // Most recently used first.
  std::list<std::string> order_;
};

}  // namespace jnav
