#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace jnav {

using SteadyTime = std::chrono::steady_clock::time_point;

/// Monotonic time source for debounce and spinner timers.
class IClock {
 public:
  virtual ~IClock() = default;
  virtual SteadyTime now() const = 0;
};

class SteadyClock final : public IClock {
 public:
  SteadyTime now() const override { return std::chrono::steady_clock::now(); }
};

/// Runs background work items off the input path.
/// Jobs MUST own everything they touch (values or shared_ptr captures).
class IWorkExecutor {
 public:
  virtual ~IWorkExecutor() = default;
  virtual void submit(std::function<void()> job) = 0;
};

/// Runs each job on its own detached std::thread.
/// A job that never returns only blocks its own channel; shutdown does not wait for it.
class ThreadExecutor final : public IWorkExecutor {
 public:
  void submit(std::function<void()> job) override;
};

/// Hand-off point from worker threads to the foreground loop.
/// Workers post completed values; only the foreground thread drains them.
template <typename T>
class ResultMailbox {
 public:
  /// Called after every post, outside the lock (used to wake the input loop).
  void set_notifier(std::function<void()> notifier) {
    std::lock_guard<std::mutex> lock(mu_);
    notifier_ = std::move(notifier);
  }

  void post(T value) {
    std::function<void()> notifier;
    {
      std::lock_guard<std::mutex> lock(mu_);
      items_.push_back(std::move(value));
      notifier = notifier_;
    }
    if (notifier) notifier();
  }

  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<T> out;
    out.swap(items_);
    return out;
  }

 private:
  std::mutex mu_;
  std::vector<T> items_;
  std::function<void()> notifier_;
};

}  // namespace jnav
