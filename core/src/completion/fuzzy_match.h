#pragma once

#include <string_view>

namespace jnav::completion {

/// Computes a fuzzy match score for `needle` within `haystack` (ASCII case-insensitive).
/// MUST return false when all needle characters cannot be found in order.
/// Contiguous hits outscore scattered subsequences; word-start hits score higher still.
bool fuzzy_match_score(std::string_view haystack, std::string_view needle, int* score);

/// True when `haystack` starts with `needle` byte for byte.
bool has_exact_prefix(std::string_view haystack, std::string_view needle);

}  // namespace jnav::completion
