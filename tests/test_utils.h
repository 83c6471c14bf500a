#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "jnav/background.h"
#include "jnav/json_value.h"

/// Clock that only moves when a test advances it.
class ManualClock final : public jnav::IClock {
 public:
  jnav::SteadyTime now() const override { return now_; }
  void advance(std::chrono::milliseconds step) { now_ += step; }

 private:
  jnav::SteadyTime now_{std::chrono::hours(1)};
};

/// Queues submitted jobs so a test decides when, and in which order, they run.
class ManualExecutor final : public jnav::IWorkExecutor {
 public:
  void submit(std::function<void()> job) override { jobs_.push_back(std::move(job)); }

  size_t pending() const { return jobs_.size(); }

  void run(size_t index) {
    std::function<void()> job = std::move(jobs_.at(index));
    jobs_.erase(jobs_.begin() + static_cast<std::ptrdiff_t>(index));
    job();
  }

  void run_all() {
    while (!jobs_.empty()) run(0);
  }

 private:
  std::vector<std::function<void()>> jobs_;
};

inline jnav::Json parse_json(const std::string& text) {
  return jnav::Json::parse(text);
}
