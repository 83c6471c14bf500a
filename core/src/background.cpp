#include "jnav/background.h"

#include <thread>

namespace jnav {

void ThreadExecutor::submit(std::function<void()> job) {
  std::thread worker(std::move(job));
  worker.detach();
}

}  // namespace jnav
