#ifndef FLOWGATE_TASK_SCHEDULER_HPP
#define FLOWGATE_TASK_SCHEDULER_HPP

#include <coroutine>
#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "coro_task.hpp"
#include "ts_queue.hpp"

/*
  Coroutine workers are plain kernel threads pulling resumable handles from a
  shared submission queue. Every flow-control primitive resumes its waiters by
  pushing them here, so a waiter never runs on the thread that released it
  while that thread still holds the primitive's lock.
*/

namespace flowgate {

struct task_scheduler {
  std::vector<std::thread> coro_workers;
  ts_queue<std::coroutine_handle<>> external_coro_queue;

  // Coroutine API
  template <typename T> coro_task<T> add_coro(coro_task<T> task);

  template <typename Callable, typename... Args>
    requires(!is_coro_task_v<std::invoke_result_t<Callable, Args...>>)
  auto add_coro(Callable &&callable, Args &&...args)
      -> coro_task<std::invoke_result_t<Callable, Args...>>;

  // Queue a handle for resumption on a worker
  void schedule_coro_handle(std::coroutine_handle<> handle);

  std::size_t worker_count() const { return coro_workers.size(); }

  explicit task_scheduler(runtime_config config);
  ~task_scheduler();

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;
};

extern task_scheduler g_global_task_scheduler;

// =============================================================================
// Coroutine API Implementation
// =============================================================================

// Schedule an existing coro_task on workers (eagerly starts execution)
template <typename T>
coro_task<T> task_scheduler::add_coro(coro_task<T> task) {
  task.start();
  return task;
}

// Wrap a regular callable in a coroutine and schedule it
template <typename Callable, typename... Args>
  requires(!is_coro_task_v<std::invoke_result_t<Callable, Args...>>)
auto task_scheduler::add_coro(Callable &&callable, Args &&...args)
    -> coro_task<std::invoke_result_t<Callable, Args...>> {
  using result_type = std::invoke_result_t<Callable, Args...>;

  auto wrapper = [](std::decay_t<Callable> c,
                    std::decay_t<Args>... a) -> coro_task<result_type> {
    if constexpr (std::is_void_v<result_type>) {
      c(std::move(a)...);
      co_return;
    } else {
      co_return c(std::move(a)...);
    }
  };

  auto task = wrapper(std::forward<Callable>(callable),
                      std::forward<Args>(args)...);
  task.start();
  return task;
}

// =============================================================================
// Free Function Wrappers
// =============================================================================

template <typename T> coro_task<T> add_coro(coro_task<T> task) {
  return g_global_task_scheduler.add_coro(std::move(task));
}

template <typename Callable, typename... Args>
  requires(!is_coro_task_v<std::invoke_result_t<Callable, Args...>>)
auto add_coro(Callable &&callable, Args &&...args) {
  return g_global_task_scheduler.add_coro(std::forward<Callable>(callable),
                                          std::forward<Args>(args)...);
}

// Queue a handle on the global scheduler
void schedule_coro_handle(std::coroutine_handle<> handle);

} // namespace flowgate

#endif
