#ifndef FLOWGATE_ASYNC_RUNTIME_HPP
#define FLOWGATE_ASYNC_RUNTIME_HPP

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "coro_task.hpp"

namespace flowgate {

// =============================================================================
// Async Runtime - drives coroutines from plain threads
// =============================================================================

class async_runtime {
public:
  // Run a single coroutine to completion, return its result
  template <typename T> T run(coro_task<T> task) { return task.get(); }

  // Block on a coroutine from non-coroutine context
  template <typename T> T block_on(coro_task<T> task) {
    return run(std::move(task));
  }

  // Spawn and detach (fire-and-forget). The task is kept alive until
  // collect_detached() observes it finished, or the runtime is destroyed.
  template <typename T> void spawn_detached(coro_task<T> task) {
    auto shared_task = std::make_shared<coro_task<T>>(std::move(task));
    shared_task->start();
    std::lock_guard<std::mutex> lock(detached_mutex_);
    detached_tasks_.push_back(
        [shared_task]() { return shared_task->is_ready(); });
  }

  // Drop finished detached tasks; returns how many are still running
  std::size_t collect_detached() {
    std::lock_guard<std::mutex> lock(detached_mutex_);
    detached_tasks_.erase(std::remove_if(detached_tasks_.begin(),
                                         detached_tasks_.end(),
                                         [](auto &done) { return done(); }),
                          detached_tasks_.end());
    return detached_tasks_.size();
  }

private:
  std::mutex detached_mutex_;
  std::vector<std::function<bool()>> detached_tasks_;
};

// Global runtime instance
extern async_runtime g_runtime;

// =============================================================================
// Structured Concurrency: when_all
// =============================================================================

// Start every task, then await them in order. Every task is awaited even if
// an earlier one failed; the first failure is rethrown afterwards.
template <typename T>
coro_task<std::vector<T>> when_all(std::vector<coro_task<T>> tasks) {
  for (auto &t : tasks)
    t.start();

  std::vector<T> results;
  results.reserve(tasks.size());
  std::exception_ptr first_error;
  for (auto &t : tasks) {
    try {
      results.push_back(co_await t);
    } catch (...) {
      if (!first_error)
        first_error = std::current_exception();
    }
  }
  if (first_error)
    std::rethrow_exception(first_error);

  co_return results;
}

inline coro_task<void> when_all(std::vector<coro_task<void>> tasks) {
  for (auto &t : tasks)
    t.start();

  std::exception_ptr first_error;
  for (auto &t : tasks) {
    try {
      co_await t;
    } catch (...) {
      if (!first_error)
        first_error = std::current_exception();
    }
  }
  if (first_error)
    std::rethrow_exception(first_error);
}

} // namespace flowgate

#endif
