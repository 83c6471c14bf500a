#include "completion/fuzzy_match.h"

#include <algorithm>
#include <cctype>
#include <string>

#include "util/string_util.h"

namespace jnav::completion {

namespace {

struct ContiguousHit {
  bool found = false;
  size_t position = 0;
  int quality_rank = 0;  // 2=whole-word, 1=word-start, 0=other
};

bool is_word_char(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_';
}

ContiguousHit find_best_contiguous_hit(std::string_view haystack, std::string_view needle) {
  ContiguousHit best;
  if (needle.empty() || haystack.empty()) return best;

  std::string lower_hay = util::to_lower(haystack);
  std::string lower_needle = util::to_lower(needle);
  size_t search_from = 0;
  while (search_from <= lower_hay.size()) {
    size_t pos = lower_hay.find(lower_needle, search_from);
    if (pos == std::string::npos) break;

    bool before_ok = (pos == 0) || !is_word_char(haystack[pos - 1]);
    size_t end_pos = pos + lower_needle.size();
    bool after_ok = (end_pos >= haystack.size()) || !is_word_char(haystack[end_pos]);
    int quality_rank = (before_ok && after_ok ? 2 : 0) + (before_ok ? 1 : 0);

    if (!best.found || quality_rank > best.quality_rank ||
        (quality_rank == best.quality_rank && pos < best.position)) {
      best.found = true;
      best.position = pos;
      best.quality_rank = quality_rank;
      if (quality_rank == 3 && pos == 0) break;
    }
    search_from = pos + 1;
  }
  return best;
}

}  // namespace

bool fuzzy_match_score(std::string_view haystack, std::string_view needle, int* score) {
  if (needle.empty()) {
    if (score) *score = 0;
    return true;
  }
  if (haystack.empty()) return false;
  std::string lower_hay = util::to_lower(haystack);
  std::string lower_needle = util::to_lower(needle);

  size_t first_subseq = std::string::npos;
  size_t last_subseq = 0;
  size_t cursor = 0;
  for (char c : lower_needle) {
    size_t pos = lower_hay.find(c, cursor);
    if (pos == std::string::npos) return false;
    if (first_subseq == std::string::npos) first_subseq = pos;
    last_subseq = pos;
    cursor = pos + 1;
  }

  size_t span = (last_subseq >= first_subseq) ? (last_subseq - first_subseq + 1) : 0;
  int value = 100000 - static_cast<int>(std::min<size_t>(span, 900) * 100) -
              static_cast<int>(std::min<size_t>(first_subseq, 10000));

  ContiguousHit hit = find_best_contiguous_hit(haystack, needle);
  if (hit.found) {
    value += 50000;
    if (hit.quality_rank >= 1) value += 20000;
    if (hit.quality_rank >= 2) value += 40000;
  }
  if (score) *score = value;
  return true;
}

bool has_exact_prefix(std::string_view haystack, std::string_view needle) {
  return haystack.size() >= needle.size() && haystack.compare(0, needle.size(), needle) == 0;
}

}  // namespace jnav::completion
