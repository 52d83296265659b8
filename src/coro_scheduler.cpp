#include <coroutine>
#include <functional>
#include <thread>

#include "flowgate/task_scheduler.hpp"

namespace flowgate {

// Drain the submission queue until it is closed and empty
static void coro_worker(task_scheduler &scheduler) {
  while (auto handle = scheduler.external_coro_queue.receive()) {
    if (*handle && !handle->done())
      handle->resume();
  }
}

void task_scheduler::schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;

  // After shutdown the queue rejects work; run inline so nothing is stranded
  if (!external_coro_queue.send(handle))
    handle.resume();
}

void schedule_coro_handle(std::coroutine_handle<> handle) {
  g_global_task_scheduler.schedule_coro_handle(handle);
}

// Start coroutine workers (called from the task_scheduler constructor)
void init_coro_workers(task_scheduler &scheduler, std::size_t num_workers) {
  scheduler.coro_workers.reserve(num_workers);
  for (std::size_t i = 0; i < num_workers; ++i)
    scheduler.coro_workers.emplace_back(coro_worker, std::ref(scheduler));
}

// Stop coroutine workers (called from the task_scheduler destructor)
void shutdown_coro_workers(task_scheduler &scheduler) {
  scheduler.external_coro_queue.close();

  for (auto &worker : scheduler.coro_workers) {
    if (worker.joinable())
      worker.join();
  }

  scheduler.coro_workers.clear();
}

} // namespace flowgate
