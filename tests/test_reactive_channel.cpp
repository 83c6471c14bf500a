#include "test_harness.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "jnav/reactive_channel.h"
#include "jnav/result_cache.h"
#include "test_utils.h"

using namespace std::chrono_literals;

namespace {

void test_trigger_waits_for_debounce() {
  ManualClock clock;
  jnav::ReactiveChannel channel(600ms);
  channel.trigger(clock.now());
  expect_true(channel.state() == jnav::ChannelState::Debouncing, "debouncing after trigger");
  clock.advance(599ms);
  expect_true(!channel.ready(clock.now()), "not ready before the quiet period");
  clock.advance(1ms);
  expect_true(channel.ready(clock.now()), "ready once the quiet period elapsed");
}

void test_retrigger_restarts_timer() {
  ManualClock clock;
  jnav::ReactiveChannel channel(600ms);
  channel.trigger(clock.now());
  clock.advance(400ms);
  jnav::Generation second = channel.trigger(clock.now());
  clock.advance(400ms);
  expect_true(!channel.ready(clock.now()), "second trigger restarted the timer");
  clock.advance(200ms);
  expect_true(channel.ready(clock.now()), "ready after the second quiet period");
  jnav::GenerationToken token = channel.start();
  expect_eq(token.generation(), second, "evaluation runs for the latest generation");
  expect_true(channel.state() == jnav::ChannelState::Evaluating, "evaluating");
}

void test_finish_applies_latest_result() {
  ManualClock clock;
  jnav::ReactiveChannel channel(0ms);
  channel.trigger(clock.now());
  jnav::GenerationToken token = channel.start();
  expect_true(channel.finish(token.generation(), true), "current result applies");
  expect_true(channel.state() == jnav::ChannelState::Settled, "settled");
  expect_eq(channel.last_applied(), token.generation(), "last applied recorded");
}

void test_failed_result_marks_errored() {
  ManualClock clock;
  jnav::ReactiveChannel channel(0ms);
  channel.trigger(clock.now());
  jnav::GenerationToken token = channel.start();
  expect_true(channel.finish(token.generation(), false), "failure still applies");
  expect_true(channel.state() == jnav::ChannelState::Errored, "errored");
}

void test_stale_result_is_discarded() {
  ManualClock clock;
  jnav::ReactiveChannel channel(10ms);
  channel.trigger(clock.now());
  clock.advance(10ms);
  jnav::GenerationToken first = channel.start();
  channel.trigger(clock.now());
  expect_true(first.stale(), "token sees the newer trigger");
  expect_true(!channel.ready(clock.now() + 10ms), "no second evaluation while one is in flight");
  expect_true(!channel.finish(first.generation(), true), "stale result rejected");
  expect_true(channel.state() == jnav::ChannelState::Debouncing, "newer trigger keeps the state");
  expect_eq(channel.last_applied(), 0, "nothing applied");
  clock.advance(10ms);
  expect_true(channel.ready(clock.now()), "pending trigger fires after the stale finish");
}

void test_results_never_go_backwards() {
  ManualClock clock;
  jnav::ReactiveChannel channel(0ms);
  channel.trigger(clock.now());
  jnav::GenerationToken token = channel.start();
  expect_true(channel.finish(token.generation(), true), "first apply");
  expect_true(!channel.finish(token.generation(), true), "duplicate delivery ignored");
}

void test_invalidate_drops_pending_and_in_flight() {
  ManualClock clock;
  jnav::ReactiveChannel channel(0ms);
  channel.trigger(clock.now());
  channel.invalidate();
  expect_true(!channel.pending(), "pending trigger dropped");
  expect_true(channel.state() == jnav::ChannelState::Idle, "idle after invalidate");
  expect_true(!channel.deadline().has_value(), "no timer");

  channel.trigger(clock.now());
  jnav::GenerationToken token = channel.start();
  channel.invalidate();
  expect_true(token.stale(), "in-flight work observes invalidation");
  expect_true(!channel.finish(token.generation(), true), "invalidated result rejected");
  expect_true(channel.state() == jnav::ChannelState::Idle, "back to idle");
  expect_true(!channel.in_flight(), "nothing in flight");
}

void test_state_names() {
  expect_str_eq(jnav::channel_state_name(jnav::ChannelState::Evaluating), "evaluating",
                "state name");
  expect_str_eq(jnav::channel_state_name(jnav::ChannelState::Errored), "errored", "state name");
}

void test_spinner_cycles_frames() {
  ManualClock clock;
  jnav::Spinner spinner(300ms);
  expect_true(!spinner.next_tick().has_value(), "stopped spinner has no timer");
  spinner.start(clock.now());
  expect_str_eq(spinner.frame(), "⠋", "first frame");
  clock.advance(299ms);
  expect_true(!spinner.tick(clock.now()), "no advance before interval");
  clock.advance(1ms);
  expect_true(spinner.tick(clock.now()), "advances at interval");
  expect_str_eq(spinner.frame(), "⠙", "second frame");
  for (int i = 0; i < 10; ++i) {
    clock.advance(300ms);
    spinner.tick(clock.now());
  }
  expect_str_eq(spinner.frame(), "⠙", "ten frames wrap around");
  spinner.stop();
  expect_true(!spinner.running(), "stopped");
}

void test_cache_evicts_least_recently_used() {
  jnav::ResultCache cache(2);
  auto values = std::make_shared<const std::vector<jnav::Json>>(std::vector<jnav::Json>{1});
  cache.put(".a", values);
  cache.put(".b", values);
  expect_true(cache.find(".a") != nullptr, "hit refreshes .a");
  cache.put(".c", values);
  expect_true(cache.find(".b") == nullptr, ".b evicted");
  expect_true(cache.find(".a") != nullptr, ".a kept");
  expect_true(cache.find(".c") != nullptr, ".c stored");
  expect_eq(cache.size(), 2, "bounded size");
}

void test_cache_disabled_with_zero_entries() {
  jnav::ResultCache cache(0);
  cache.put(".a", std::make_shared<const std::vector<jnav::Json>>());
  expect_true(cache.find(".a") == nullptr, "nothing stored");
}

}  // namespace

void register_reactive_channel_tests(std::vector<TestCase>& tests) {
  tests.push_back({"trigger_waits_for_debounce", test_trigger_waits_for_debounce});
  tests.push_back({"retrigger_restarts_timer", test_retrigger_restarts_timer});
  tests.push_back({"finish_applies_latest_result", test_finish_applies_latest_result});
  tests.push_back({"failed_result_marks_errored", test_failed_result_marks_errored});
  tests.push_back({"stale_result_is_discarded", test_stale_result_is_discarded});
  tests.push_back({"results_never_go_backwards", test_results_never_go_backwards});
  tests.push_back({"invalidate_drops_pending_and_in_flight",
                   test_invalidate_drops_pending_and_in_flight});
  tests.push_back({"state_names", test_state_names});
  tests.push_back({"spinner_cycles_frames", test_spinner_cycles_frames});
  tests.push_back({"cache_evicts_least_recently_used", test_cache_evicts_least_recently_used});
  tests.push_back({"cache_disabled_with_zero_entries", test_cache_disabled_with_zero_entries});
}
