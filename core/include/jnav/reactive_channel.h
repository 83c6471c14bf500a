#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "jnav/background.h"

namespace jnav {

using Generation = uint64_t;

enum class ChannelState {
  Idle,
  Debouncing,
  Evaluating,
  Settled,
  Errored,
};

const char* channel_state_name(ChannelState state);

/// Read-only view of a channel's latest generation, handed to background work
/// so it can stop at chunk boundaries once a newer request exists.
class GenerationToken {
 public:
  GenerationToken() = default;
  GenerationToken(std::shared_ptr<const std::atomic<Generation>> latest, Generation generation)
      : latest_(std::move(latest)), generation_(generation) {}

  Generation generation() const { return generation_; }
  /// True once the owning channel has moved past this generation.
  bool stale() const { return latest_ && latest_->load(std::memory_order_acquire) != generation_; }

 private:
  std::shared_ptr<const std::atomic<Generation>> latest_;
  Generation generation_ = 0;
};

/// Debounce and generation bookkeeping for one reactive channel.
/// Idle -> Debouncing -> Evaluating -> Settled | Errored, re-entering Debouncing on
/// every trigger. At most one evaluation is in flight; results whose generation is
/// not the latest are dropped without a state change.
class ReactiveChannel {
 public:
  explicit ReactiveChannel(std::chrono::milliseconds debounce);

  /// Records a new triggering event and restarts the debounce timer.
  Generation trigger(SteadyTime now);
  /// Supersedes any pending or in-flight work without scheduling new work.
  void invalidate();
  /// True when the timer elapsed, no newer trigger arrived and nothing is in flight.
  bool ready(SteadyTime now) const;
  /// Moves to Evaluating for the latest generation.
  /// MUST only be called when ready() returned true.
  GenerationToken start();
  /// Reports completion of the in-flight work for `generation`.
  /// Returns true when the result is current and should be applied.
  bool finish(Generation generation, bool ok);

  ChannelState state() const { return state_; }
  Generation latest() const { return latest_->load(std::memory_order_acquire); }
  Generation last_applied() const { return last_applied_; }
  bool pending() const { return pending_; }
  bool in_flight() const { return in_flight_; }
  /// When the debounce timer fires, if one is running.
  std::optional<SteadyTime> deadline() const;
  std::chrono::milliseconds debounce() const { return debounce_; }

 private:
  std::chrono::milliseconds debounce_;
  std::shared_ptr<std::atomic<Generation>> latest_;
  ChannelState state_ = ChannelState::Idle;
  bool pending_ = false;
  bool in_flight_ = false;
  Generation in_flight_generation_ = 0;
  Generation last_applied_ = 0;
  SteadyTime deadline_{};
};

/// Pending indicator that advances one frame per interval while running.
class Spinner {
 public:
  explicit Spinner(std::chrono::milliseconds interval);

  void start(SteadyTime now);
  void stop();
  /// Advances the frame when the interval elapsed. Returns true when the frame changed.
  bool tick(SteadyTime now);

  bool running() const { return running_; }
  const char* frame() const;
  std::optional<SteadyTime> next_tick() const;

 private:
  std::chrono::milliseconds interval_;
  bool running_ = false;
  size_t frame_ = 0;
  SteadyTime next_{};
};

}  // namespace jnav
