#include "jnav/result_cache.h"

#include <utility>

namespace jnav {

ResultCache::ResultCache(size_t max_entries) : max_entries_(max_entries) {}

ResultValues ResultCache::find(const std::string& query) {
  auto it = entries_.find(query);
  if (it == entries_.end()) return nullptr;
  order_.splice(order_.begin(), order_, it->second.position);
  return it->second.values;
}

void ResultCache::put(const std::string& query, ResultValues values) {
  if (max_entries_ == 0) return;
  auto it = entries_.find(query);
  if (it != entries_.end()) {
    it->second.values = std::move(values);
    order_.splice(order_.begin(), order_, it->second.position);
    return;
  }
  order_.push_front(query);
  entries_.emplace(query, Entry{std::move(values), order_.begin()});
  while (order_.size() > max_entries_) {
    entries_.erase(order_.back());
    order_.pop_back();
  }
}

}  // namespace jnav
