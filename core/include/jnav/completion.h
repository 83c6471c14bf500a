#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "jnav/json_value.h"
#include "jnav/reactive_channel.h"
#include "jnav/view_projector.h"

namespace jnav {

enum class SuggestionKind {
  Identity,
  ObjectKey,
  ArrayIndex,
};

/// A candidate completion. `text` replaces the whole buffer when accepted;
/// `label` is the bare key or index shown in the list.
struct Suggestion {
  std::string text;
  std::string label;
  SuggestionKind kind = SuggestionKind::Identity;
  int score = 0;
};

struct PathStep {
  enum class Kind {
    Key,
    Index,
    Iterate,
  } kind = Kind::Key;
  std::string key;
  int64_t index = 0;
};

/// Buffer text split into the already-complete path and the token being typed.
struct PathPrefix {
  enum class Partial {
    None,
    Key,
    Index,
  };

  /// False when the text is not a plain path expression (pipes, functions, ...).
  bool valid = false;
  std::vector<PathStep> steps;
  /// Source text of `steps`; candidates are appended to it.
  std::string complete_text;
  Partial partial = Partial::None;
  std::string partial_text;
};

/// Splits path text like `.items[2].na` into steps and a partial token.
/// A trailing `.name` is treated as a partial key; `[` opens a partial index.
PathPrefix parse_path_prefix(const std::string& text);

struct CompletionRequest {
  std::string text;
  size_t list_length = 100;
  size_t load_chunk_size = 50000;
  size_t result_chunk_size = 100;
};

struct CompletionOutcome {
  Generation generation = 0;
  bool cancelled = false;
  std::string text;
  std::vector<Suggestion> suggestions;
  /// Matches found before the list cap was applied.
  size_t total_matches = 0;
  bool truncated = false;
};

/// Proposes identity, object-key and array-index continuations for `request.text`
/// resolved against `documents`.
/// Candidates are loaded `load_chunk_size` at a time and matched in batches of
/// `result_chunk_size`; MUST return a cancelled outcome as soon as `token` turns stale
/// at a batch boundary. Unresolvable paths yield an empty list.
CompletionOutcome complete_path(const CompletionRequest& request,
                                const std::vector<Json>& documents,
                                const GenerationToken& token);

/// Hint line text for a finished completion.
std::string describe_completion(const CompletionOutcome& outcome);

/// Suggestion-mode list with wraparound selection and a scrolled window.
class SuggestionList {
 public:
  explicit SuggestionList(size_t visible_lines);

  void assign(std::vector<Suggestion> items);
  void clear();
  void next();
  void previous();

  bool empty() const { return items_.empty(); }
  const std::vector<Suggestion>& items() const { return items_; }
  /// Index of the highlighted item. MUST only be read when !empty().
  size_t active() const { return window_.cursor(); }
  const Suggestion& active_item() const;
  ViewWindow window() const { return window_.window(); }

 private:
  std::vector<Suggestion> items_;
  ViewProjector window_;
};

}  // namespace jnav
