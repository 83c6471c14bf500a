#include "jnav/navigator.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace jnav {

namespace {

TreeOptions tree_options(const EngineConfig& config) {
  TreeOptions options;
  options.expand_depth = config.expand_depth;
  options.limit_length = config.limit_length;
  return options;
}

}  // namespace

size_t viewer_capacity(size_t terminal_rows, const EngineConfig& config) {
  size_t reserved = 1 + config.suggestion_lines + (config.no_hint ? 0 : 1);
  return terminal_rows > reserved ? terminal_rows - reserved : 1;
}

Navigator::Navigator(EngineConfig config,
                     std::vector<Json> documents,
                     std::shared_ptr<IFilterEngine> engine,
                     IWorkExecutor& query_executor,
                     IWorkExecutor& completion_executor,
                     const IClock& clock)
    : config_(std::move(config)),
      documents_(std::make_shared<const std::vector<Json>>(std::move(documents))),
      engine_(std::move(engine)),
      query_executor_(query_executor),
      completion_executor_(completion_executor),
      clock_(clock),
      keymap_(Keymap::defaults()),
      buffer_(config_.word_break_chars, config_.edit_mode),
      tree_(tree_options(config_)),
      projector_(viewer_capacity(viewport_.rows, config_)),
      cache_(config_.result_cache_entries),
      query_channel_(config_.query_debounce),
      resize_channel_(config_.resize_debounce),
      completion_channel_(std::chrono::milliseconds(0)),
      spinner_(config_.spin_interval),
      query_mailbox_(std::make_shared<ResultMailbox<EvaluationResult>>()),
      completion_mailbox_(std::make_shared<ResultMailbox<CompletionOutcome>>()),
      suggestions_(config_.suggestion_lines) {
  tree_.build(*documents_);
  refresh_rows(std::nullopt);
}

void Navigator::set_viewport(size_t rows, size_t columns) {
  viewport_ = ViewportSize{rows, columns};
  pending_viewport_ = viewport_;
  projector_.resize(viewer_capacity(rows, config_));
}

void Navigator::resize(size_t rows, size_t columns) {
  pending_viewport_ = ViewportSize{rows, columns};
  resize_channel_.trigger(clock_.now());
}

void Navigator::set_wake_callback(std::function<void()> callback) {
  query_mailbox_->set_notifier(callback);
  completion_mailbox_->set_notifier(std::move(callback));
}

void Navigator::handle_key(const KeyChord& chord) {
  Action action = keymap_.resolve(chord, focus_);
  if (action == Action::None && focus_ == FocusMode::Suggesting) {
    // Keys without a suggestion-mode meaning leave the list and act as edits.
    action = keymap_.resolve(chord, FocusMode::Editing);
    if (action == Action::None) {
      exit_suggesting();
      return;
    }
  }
  handle(action, chord.ch);
}

void Navigator::handle(Action action, uint32_t ch) {
  if (action == Action::Quit) {
    quit_ = true;
    return;
  }
  if (focus_ == FocusMode::Suggesting && handle_suggesting(action)) return;

  switch (action) {
    case Action::ViewerUp:
    case Action::ViewerDown:
    case Action::ViewerHead:
    case Action::ViewerTail:
    case Action::ToggleFold:
    case Action::ExpandAll:
    case Action::CollapseAll:
      apply_viewer(action);
      return;
    case Action::Complete:
      completion_channel_.trigger(clock_.now());
      return;
    case Action::NextSuggestion:
    case Action::PrevSuggestion:
    case Action::AcceptSuggestion:
    case Action::CancelSuggestion:
    case Action::None:
      return;
    default:
      apply_edit(action, ch);
      return;
  }
}

bool Navigator::handle_suggesting(Action action) {
  switch (action) {
    case Action::NextSuggestion:
      suggestions_.next();
      return true;
    case Action::PrevSuggestion:
      suggestions_.previous();
      return true;
    case Action::AcceptSuggestion: {
      std::string text = suggestions_.active_item().text;
      exit_suggesting();
      uint64_t before = buffer_.revision();
      buffer_.replace(text);
      if (buffer_.revision() != before) {
        query_channel_.trigger(clock_.now());
        completion_channel_.invalidate();
      }
      return true;
    }
    case Action::CancelSuggestion:
      exit_suggesting();
      return true;
    default:
      exit_suggesting();
      return false;
  }
}

void Navigator::exit_suggesting() {
  focus_ = FocusMode::Editing;
  suggestions_.clear();
}

void Navigator::apply_edit(Action action, uint32_t ch) {
  const uint64_t before = buffer_.revision();
  switch (action) {
    case Action::InsertChar:
      if (ch != 0) buffer_.insert(ch);
      break;
    case Action::Backspace:
      buffer_.erase();
      break;
    case Action::EraseAll:
      buffer_.erase_all();
      break;
    case Action::ErasePrevWord:
      buffer_.erase_to_previous_boundary();
      break;
    case Action::EraseNextWord:
      buffer_.erase_to_next_boundary();
      break;
    case Action::MoveLeft:
      buffer_.move_left();
      break;
    case Action::MoveRight:
      buffer_.move_right();
      break;
    case Action::MoveHead:
      buffer_.move_to_head();
      break;
    case Action::MoveTail:
      buffer_.move_to_tail();
      break;
    case Action::PrevWord:
      buffer_.move_to_previous_boundary();
      break;
    case Action::NextWord:
      buffer_.move_to_next_boundary();
      break;
    default:
      break;
  }
  if (buffer_.revision() != before) {
    query_channel_.trigger(clock_.now());
    completion_channel_.invalidate();
  }
}

void Navigator::apply_viewer(Action action) {
  switch (action) {
    case Action::ViewerUp:
      projector_.up();
      return;
    case Action::ViewerDown:
      projector_.down();
      return;
    case Action::ViewerHead:
      projector_.head();
      return;
    case Action::ViewerTail:
      projector_.tail();
      return;
    default:
      break;
  }
  if (rows_.empty()) return;
  const FlatRow current = rows_[projector_.cursor()];
  if (action == Action::ToggleFold) {
    if (current.kind != RowKind::Node || !tree_.toggle(current.node_id)) return;
  } else if (action == Action::ExpandAll) {
    tree_.expand_all();
  } else if (action == Action::CollapseAll) {
    tree_.collapse_all();
  }
  refresh_rows(current.node_id);
}

void Navigator::tick() {
  const SteadyTime now = clock_.now();
  drain_query_results();
  drain_completion_results();

  if (resize_channel_.ready(now)) fire_resize();
  if (query_channel_.ready(now)) fire_query(now);
  if (completion_channel_.ready(now)) fire_completion();

  if (query_channel_.in_flight()) {
    spinner_.start(now);
    spinner_.tick(now);
  } else {
    spinner_.stop();
  }
}

std::optional<SteadyTime> Navigator::next_wakeup() const {
  std::optional<SteadyTime> out;
  auto consider = [&out](const std::optional<SteadyTime>& candidate) {
    if (!candidate.has_value()) return;
    if (!out.has_value() || *candidate < *out) out = candidate;
  };
  // An in-flight channel waits for its mailbox notification instead of a timer.
  if (!query_channel_.in_flight()) consider(query_channel_.deadline());
  if (!completion_channel_.in_flight()) consider(completion_channel_.deadline());
  consider(resize_channel_.deadline());
  consider(spinner_.next_tick());
  return out;
}

const char* Navigator::spinner_frame() const {
  return spinner_.running() ? spinner_.frame() : nullptr;
}

void Navigator::fire_query(SteadyTime now) {
  const GenerationToken token = query_channel_.start();
  const std::string query = buffer_.text();

  if (ResultValues cached = cache_.find(query)) {
    query_channel_.finish(token.generation(), true);
    show_values(query, cached);
    set_hint(HintLevel::Info,
             "Query '" + query + "' was already executed. Result was retrieved from cache.");
    return;
  }

  spinner_.start(now);
  query_executor_.submit([engine = engine_, documents = documents_, mailbox = query_mailbox_,
                          query, generation = token.generation()]() {
    mailbox->post(run_evaluation(*engine, query, *documents, generation));
  });
}

void Navigator::fire_completion() {
  const GenerationToken token = completion_channel_.start();
  CompletionRequest request;
  request.text = buffer_.text();
  request.list_length = config_.suggestion_list_length;
  request.load_chunk_size = config_.search_load_chunk_size;
  request.result_chunk_size = config_.search_result_chunk_size;

  completion_executor_.submit([documents = documents_, mailbox = completion_mailbox_, request,
                               token]() {
    CompletionOutcome outcome;
    try {
      outcome = complete_path(request, *documents, token);
    } catch (const std::exception&) {
      // Reported as an empty list.
      outcome = CompletionOutcome{};
      outcome.generation = token.generation();
      outcome.text = request.text;
    }
    mailbox->post(std::move(outcome));
  });
}

void Navigator::fire_resize() {
  const GenerationToken token = resize_channel_.start();
  viewport_ = pending_viewport_;
  projector_.resize(viewer_capacity(viewport_.rows, config_));
  resize_channel_.finish(token.generation(), true);
}

void Navigator::drain_query_results() {
  for (auto& result : query_mailbox_->drain()) {
    const bool ok = result.status == EvaluationStatus::Success;
    if (!query_channel_.finish(result.generation, ok)) continue;
    if (!ok) {
      set_hint(result.soft_failure ? HintLevel::Warning : HintLevel::Error,
               std::move(result.error_message));
      continue;
    }
    auto values = std::make_shared<const std::vector<Json>>(std::move(result.values));
    cache_.put(result.query, values);
    show_values(result.query, values);
    hint_.reset();
  }
}

void Navigator::drain_completion_results() {
  for (auto& outcome : completion_mailbox_->drain()) {
    if (!completion_channel_.finish(outcome.generation, !outcome.cancelled)) continue;
    if (outcome.cancelled) continue;
    set_hint(outcome.suggestions.empty() ? HintLevel::Warning : HintLevel::Info,
             describe_completion(outcome));
    if (outcome.suggestions.empty()) continue;
    suggestions_.assign(std::move(outcome.suggestions));
    focus_ = FocusMode::Suggesting;
  }
}

void Navigator::show_values(const std::string& query, const ResultValues& values) {
  tree_.build(*values);
  applied_query_ = query;
  projector_.reset();
  refresh_rows(std::nullopt);
}

void Navigator::refresh_rows(std::optional<NodeId> keep) {
  rows_ = tree_.flatten();
  projector_.set_row_count(rows_.size());
  if (!keep.has_value()) return;

  // Follow the node under the cursor, or its nearest visible ancestor after a collapse.
  NodeId target = *keep;
  while (tree_.valid(target)) {
    for (size_t i = 0; i < rows_.size(); ++i) {
      if (rows_[i].kind == RowKind::Node && rows_[i].node_id == target) {
        projector_.set_cursor(i);
        return;
      }
    }
    target = tree_.node(target).parent;
  }
}

void Navigator::set_hint(HintLevel level, std::string text) {
  if (config_.no_hint) return;
  hint_ = Hint{level, std::move(text)};
}

}  // namespace jnav
