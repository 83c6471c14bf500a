#include "jnav/reactive_channel.h"

#include <array>

namespace jnav {

namespace {

constexpr std::array<const char*, 10> kSpinnerFrames = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏",
};

}  // namespace

const char* channel_state_name(ChannelState state) {
  switch (state) {
    case ChannelState::Idle:
      return "idle";
    case ChannelState::Debouncing:
      return "debouncing";
    case ChannelState::Evaluating:
      return "evaluating";
    case ChannelState::Settled:
      return "settled";
    case ChannelState::Errored:
      return "errored";
  }
  return "idle";
}

ReactiveChannel::ReactiveChannel(std::chrono::milliseconds debounce)
    : debounce_(debounce), latest_(std::make_shared<std::atomic<Generation>>(0)) {}

Generation ReactiveChannel::trigger(SteadyTime now) {
  Generation next = latest_->load(std::memory_order_relaxed) + 1;
  latest_->store(next, std::memory_order_release);
  pending_ = true;
  deadline_ = now + debounce_;
  state_ = ChannelState::Debouncing;
  return next;
}

void ReactiveChannel::invalidate() {
  latest_->store(latest_->load(std::memory_order_relaxed) + 1, std::memory_order_release);
  pending_ = false;
  if (!in_flight_) state_ = ChannelState::Idle;
}

bool ReactiveChannel::ready(SteadyTime now) const {
  return pending_ && !in_flight_ && now >= deadline_;
}

GenerationToken ReactiveChannel::start() {
  pending_ = false;
  in_flight_ = true;
  in_flight_generation_ = latest_->load(std::memory_order_relaxed);
  state_ = ChannelState::Evaluating;
  return GenerationToken(latest_, in_flight_generation_);
}

bool ReactiveChannel::finish(Generation generation, bool ok) {
  if (in_flight_ && generation == in_flight_generation_) in_flight_ = false;
  if (generation != latest() || generation <= last_applied_) {
    // Superseded: a newer trigger owns the channel state.
    if (!in_flight_ && !pending_ && state_ == ChannelState::Evaluating) state_ = ChannelState::Idle;
    return false;
  }
  last_applied_ = generation;
  state_ = ok ? ChannelState::Settled : ChannelState::Errored;
  return true;
}

std::optional<SteadyTime> ReactiveChannel::deadline() const {
  if (!pending_) return std::nullopt;
  return deadline_;
}

Spinner::Spinner(std::chrono::milliseconds interval) : interval_(interval) {}

void Spinner::start(SteadyTime now) {
  if (running_) return;
  running_ = true;
  frame_ = 0;
  next_ = now + interval_;
}

void Spinner::stop() {
  running_ = false;
}

bool Spinner::tick(SteadyTime now) {
  if (!running_ || now < next_) return false;
  frame_ = (frame_ + 1) % kSpinnerFrames.size();
  next_ = now + interval_;
  return true;
}

const char* Spinner::frame() const {
  return kSpinnerFrames[frame_];
}

std::optional<SteadyTime> Spinner::next_tick() const {
  if (!running_) return std::nullopt;
  return next_;
}

}  // namespace jnav
