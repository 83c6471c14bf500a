#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jnav/background.h"
#include "jnav/completion.h"
#include "jnav/config.h"
#include "jnav/evaluation.h"
#include "jnav/filter_engine.h"
#include "jnav/json_tree.h"
#include "jnav/keymap.h"
#include "jnav/reactive_channel.h"
#include "jnav/result_cache.h"
#include "jnav/text_buffer.h"
#include "jnav/view_projector.h"

namespace jnav {

enum class HintLevel {
  Info,
  Warning,
  Error,
};

struct Hint {
  HintLevel level = HintLevel::Info;
  std::string text;
};

struct ViewportSize {
  size_t rows = 24;
  size_t columns = 80;
};

/// Rows left for the viewer once the prompt, suggestion and hint lines are reserved.
size_t viewer_capacity(size_t terminal_rows, const EngineConfig& config);

/// Foreground side of the engine: owns the buffer, tree and view, dispatches
/// actions and reconciles background results by generation.
/// MUST only be used from one thread; background jobs talk to it through mailboxes.
class Navigator {
 public:
  Navigator(EngineConfig config,
            std::vector<Json> documents,
            std::shared_ptr<IFilterEngine> engine,
            IWorkExecutor& query_executor,
            IWorkExecutor& completion_executor,
            const IClock& clock);

  /// Applies a terminal size immediately (startup).
  void set_viewport(size_t rows, size_t columns);
  /// Records a terminal size change; applied once the resize debounce elapses.
  void resize(size_t rows, size_t columns);

  /// Resolves a key through the keymap for the current focus and dispatches it.
  void handle_key(const KeyChord& chord);
  /// Dispatches one action. `ch` is the codepoint for InsertChar.
  void handle(Action action, uint32_t ch = 0);

  /// Drains finished background work, fires due channels and advances the spinner.
  void tick();
  /// Earliest time tick() has timer work to do, if any.
  std::optional<SteadyTime> next_wakeup() const;
  /// Invoked from worker threads after they post a result.
  void set_wake_callback(std::function<void()> callback);

  const TextBuffer& buffer() const { return buffer_; }
  const JsonTree& tree() const { return tree_; }
  const std::vector<FlatRow>& rows() const { return rows_; }
  ViewWindow window() const { return projector_.window(); }
  FocusMode focus() const { return focus_; }
  const SuggestionList& suggestions() const { return suggestions_; }
  const std::optional<Hint>& hint() const { return hint_; }
  const ReactiveChannel& query_channel() const { return query_channel_; }
  const ReactiveChannel& completion_channel() const { return completion_channel_; }
  /// Current spinner frame while an evaluation runs, nullptr otherwise.
  const char* spinner_frame() const;
  const std::string& applied_query() const { return applied_query_; }
  const ViewportSize& viewport() const { return viewport_; }
  const EngineConfig& config() const { return config_; }
  bool quit_requested() const { return quit_; }

 private:
  bool handle_suggesting(Action action);
  void apply_edit(Action action, uint32_t ch);
  void apply_viewer(Action action);
  void exit_suggesting();

  void fire_query(SteadyTime now);
  void fire_completion();
  void fire_resize();
  void drain_query_results();
  void drain_completion_results();

  void show_values(const std::string& query, const ResultValues& values);
  void refresh_rows(std::optional<NodeId> keep);
  void set_hint(HintLevel level, std::string text);

  EngineConfig config_;
  std::shared_ptr<const std::vector<Json>> documents_;
  std::shared_ptr<IFilterEngine> engine_;
  IWorkExecutor& query_executor_;
  IWorkExecutor& completion_executor_;
  const IClock& clock_;
  Keymap keymap_;

  TextBuffer buffer_;
  JsonTree tree_;
  std::vector<FlatRow> rows_;
  ViewProjector projector_;
  ResultCache cache_;
  std::string applied_query_;

  ReactiveChannel query_channel_;
  ReactiveChannel resize_channel_;
  ReactiveChannel completion_channel_;
  Spinner spinner_;
  std::shared_ptr<ResultMailbox<EvaluationResult>> query_mailbox_;
  std::shared_ptr<ResultMailbox<CompletionOutcome>> completion_mailbox_;

  FocusMode focus_ = FocusMode::Editing;
  SuggestionList suggestions_;
  std::optional<Hint> hint_;
  ViewportSize viewport_;
  ViewportSize pending_viewport_;
  bool quit_ = false;
};

}  // namespace jnav
