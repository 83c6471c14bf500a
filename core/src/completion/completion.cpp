#include "jnav/completion.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "completion/fuzzy_match.h"
#include "util/string_util.h"

namespace jnav {

namespace {

struct RawCandidate {
  std::string label;
  SuggestionKind kind = SuggestionKind::ObjectKey;
  size_t index = 0;
};

struct RankedCandidate {
  Suggestion suggestion;
  int tier = 0;
  size_t order = 0;
};

std::vector<const Json*> resolve_steps(const std::vector<PathStep>& steps,
                                       const std::vector<Json>& documents) {
  std::vector<const Json*> nodes;
  nodes.reserve(documents.size());
  for (const auto& doc : documents) nodes.push_back(&doc);

  for (const auto& step : steps) {
    std::vector<const Json*> next;
    for (const Json* node : nodes) {
      switch (step.kind) {
        case PathStep::Kind::Key: {
          if (!node->is_object()) break;
          auto it = node->find(step.key);
          if (it != node->end()) next.push_back(&*it);
          break;
        }
        case PathStep::Kind::Index: {
          if (!node->is_array()) break;
          int64_t size = static_cast<int64_t>(node->size());
          int64_t pos = step.index < 0 ? step.index + size : step.index;
          if (pos >= 0 && pos < size) next.push_back(&(*node)[static_cast<size_t>(pos)]);
          break;
        }
        case PathStep::Kind::Iterate:
          if (node->is_array() || node->is_object()) {
            for (const auto& child : *node) next.push_back(&child);
          }
          break;
      }
    }
    nodes.swap(next);
    if (nodes.empty()) break;
  }
  return nodes;
}

/// Enumerates the deduplicated keys and indices of the resolved nodes in
/// first-appearance order, a bounded chunk at a time.
class CandidateSource {
 public:
  CandidateSource(std::vector<const Json*> nodes, bool include_keys)
      : nodes_(std::move(nodes)), include_keys_(include_keys) {}

  /// Appends up to `max` candidates. Returns false once the source is exhausted.
  bool load(size_t max, std::vector<RawCandidate>& out) {
    while (out.size() < max && node_ < nodes_.size()) {
      const Json& node = *nodes_[node_];
      if (node.is_object() && include_keys_) {
        if (!started_) {
          object_it_ = node.begin();
          started_ = true;
        }
        while (out.size() < max && object_it_ != node.end()) {
          const std::string& key = object_it_.key();
          ++object_it_;
          if (!seen_keys_.insert(key).second) continue;
          out.push_back(RawCandidate{key, SuggestionKind::ObjectKey, 0});
        }
        if (object_it_ != node.end()) return true;
      } else if (node.is_array()) {
        while (out.size() < max && next_index_ < node.size()) {
          out.push_back(RawCandidate{std::to_string(next_index_), SuggestionKind::ArrayIndex,
                                     next_index_});
          ++next_index_;
        }
        if (next_index_ < node.size()) return true;
      }
      ++node_;
      started_ = false;
    }
    return node_ < nodes_.size();
  }

 private:
  std::vector<const Json*> nodes_;
  bool include_keys_;
  size_t node_ = 0;
  bool started_ = false;
  Json::const_iterator object_it_;
  std::unordered_set<std::string> seen_keys_;
  // Indices are shared across arrays: the union is 0..max_len-1.
  size_t next_index_ = 0;
};

std::string candidate_text(const PathPrefix& prefix, const RawCandidate& candidate) {
  if (candidate.kind == SuggestionKind::ObjectKey) {
    return prefix.complete_text + util::format_key_step(candidate.label);
  }
  std::string base = prefix.complete_text.empty() ? "." : prefix.complete_text;
  return base + "[" + candidate.label + "]";
}

}  // namespace

CompletionOutcome complete_path(const CompletionRequest& request,
                                const std::vector<Json>& documents,
                                const GenerationToken& token) {
  CompletionOutcome outcome;
  outcome.generation = token.generation();
  outcome.text = request.text;

  PathPrefix prefix = parse_path_prefix(request.text);
  if (!prefix.valid || request.list_length == 0) return outcome;

  std::vector<RankedCandidate> ranked;
  size_t order = 0;
  size_t exact_matches = 0;
  if (request.text.empty() || request.text == ".") {
    Suggestion identity{".", ".", SuggestionKind::Identity, 0};
    ranked.push_back(RankedCandidate{identity, 0, order++});
    ++exact_matches;
  }

  const bool include_keys = prefix.partial != PathPrefix::Partial::Index;
  CandidateSource source(resolve_steps(prefix.steps, documents), include_keys);
  const size_t load_chunk = std::max<size_t>(request.load_chunk_size, 1);
  const size_t batch_size = std::max<size_t>(request.result_chunk_size, 1);

  std::vector<RawCandidate> chunk;
  bool more = true;
  bool stopped_early = false;
  while (more && !stopped_early) {
    chunk.clear();
    more = source.load(load_chunk, chunk);
    for (size_t begin = 0; begin < chunk.size(); begin += batch_size) {
      if (token.stale()) {
        outcome.cancelled = true;
        return outcome;
      }
      size_t end = std::min(chunk.size(), begin + batch_size);
      for (size_t i = begin; i < end; ++i) {
        const RawCandidate& candidate = chunk[i];
        int score = 0;
        int tier = 0;
        if (completion::has_exact_prefix(candidate.label, prefix.partial_text)) {
          ++exact_matches;
        } else if (completion::fuzzy_match_score(candidate.label, prefix.partial_text, &score)) {
          tier = 1;
        } else {
          continue;
        }
        Suggestion suggestion{candidate_text(prefix, candidate), candidate.label, candidate.kind,
                              score};
        ranked.push_back(RankedCandidate{std::move(suggestion), tier, order++});
      }
      // Later candidates can only rank below a full page of exact matches.
      if (exact_matches >= request.list_length) {
        stopped_early = end < chunk.size() || more;
        break;
      }
    }
  }
  if (token.stale()) {
    outcome.cancelled = true;
    return outcome;
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedCandidate& left, const RankedCandidate& right) {
                     if (left.tier != right.tier) return left.tier < right.tier;
                     if (left.tier == 1 && left.suggestion.score != right.suggestion.score) {
                       return left.suggestion.score > right.suggestion.score;
                     }
                     return left.order < right.order;
                   });

  outcome.total_matches = ranked.size();
  outcome.truncated = stopped_early || ranked.size() > request.list_length;
  if (ranked.size() > request.list_length) ranked.resize(request.list_length);
  outcome.suggestions.reserve(ranked.size());
  for (auto& item : ranked) outcome.suggestions.push_back(std::move(item.suggestion));
  return outcome;
}

std::string describe_completion(const CompletionOutcome& outcome) {
  if (outcome.suggestions.empty()) {
    return "No suggestion found for '" + outcome.text + "'";
  }
  const std::string count = std::to_string(outcome.suggestions.size());
  if (outcome.truncated) return "Loaded partially (" + count + ") suggestions";
  return "Loaded all (" + count + ") suggestions";
}

SuggestionList::SuggestionList(size_t visible_lines) : window_(visible_lines) {}

void SuggestionList::assign(std::vector<Suggestion> items) {
  items_ = std::move(items);
  window_.set_row_count(items_.size());
  window_.reset();
}

void SuggestionList::clear() {
  items_.clear();
  window_.set_row_count(0);
  window_.reset();
}

void SuggestionList::next() {
  if (items_.empty()) return;
  if (!window_.down()) window_.head();
}

void SuggestionList::previous() {
  if (items_.empty()) return;
  if (!window_.up()) window_.tail();
}

const Suggestion& SuggestionList::active_item() const {
  return items_.at(window_.cursor());
}

}  // namespace jnav
