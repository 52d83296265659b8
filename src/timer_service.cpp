#include "flowgate/timer_service.hpp"
#include "flowgate/task_scheduler.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>

namespace flowgate {

timer_service::timer_service() : thread_([this] { run(); }) {}

timer_service::~timer_service() { shutdown(); }

timer_id timer_service::add_timer(std::chrono::steady_clock::time_point deadline,
                                  std::coroutine_handle<> handle,
                                  wake_gate gate) {
  timer_id id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    heap_.push_back(timer_entry{deadline, handle, std::move(gate), id});
    std::push_heap(heap_.begin(), heap_.end(), std::greater<>{});
  }
  cv_.notify_one();
  return id;
}

void timer_service::cancel_timer(timer_id id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(heap_.begin(), heap_.end(),
                         [id](const timer_entry &e) { return e.id == id; });
  if (it == heap_.end())
    return;
  heap_.erase(it);
  std::make_heap(heap_.begin(), heap_.end(), std::greater<>{});
}

std::size_t timer_service::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.size();
}

void timer_service::shutdown() {
  if (!running_.exchange(false, std::memory_order_acq_rel))
    return; // already shut down

  cv_.notify_one();
  if (thread_.joinable())
    thread_.join();

  // Fire all remaining timers so no coroutine hangs
  std::vector<timer_entry> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining.swap(heap_);
  }
  if (!remaining.empty())
    std::fprintf(stderr, "[timer] firing %zu pending timer(s) on shutdown\n",
                 remaining.size());
  for (auto &entry : remaining) {
    if (entry.gate.try_claim())
      schedule_coro_handle(entry.handle);
  }
}

void timer_service::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_.load(std::memory_order_acquire)) {
    if (heap_.empty()) {
      cv_.wait(lock, [this] {
        return !heap_.empty() || !running_.load(std::memory_order_acquire);
      });
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    auto &earliest = heap_.front();

    if (earliest.deadline <= now) {
      std::pop_heap(heap_.begin(), heap_.end(), std::greater<>{});
      auto entry = std::move(heap_.back());
      heap_.pop_back();

      // Race with the primitive's releaser; exactly one side resumes
      if (entry.gate.try_claim()) {
        lock.unlock();
        schedule_coro_handle(entry.handle);
        lock.lock();
      }
    } else {
      // Copy: the heap may reallocate while we wait
      auto deadline = earliest.deadline;
      cv_.wait_until(lock, deadline);
    }
  }
}

// Global timer service instance, owned by the task_scheduler lifecycle
static timer_service *g_timer_service = nullptr;

timer_service &get_timer_service() { return *g_timer_service; }

void init_timer_service() {
  if (!g_timer_service)
    g_timer_service = new timer_service();
}

void shutdown_timer_service() {
  if (g_timer_service) {
    g_timer_service->shutdown();
    delete g_timer_service;
    g_timer_service = nullptr;
  }
}

} // namespace flowgate
