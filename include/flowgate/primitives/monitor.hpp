#ifndef FLOWGATE_PRIMITIVES_MONITOR_HPP
#define FLOWGATE_PRIMITIVES_MONITOR_HPP

#include <functional>
#include <memory>

#include "mutex.hpp"

namespace flowgate {

class async_monitor;

// Registers a condition waiter and releases the monitor mutex in one step.
// Resumes true when notified, false when the deadline passed. `sequence`
// carries the waiter's place in line across repeated waits.
class monitor_wait_awaiter : public awaitable_base<monitor_wait_awaiter, bool> {
public:
  monitor_wait_awaiter(async_monitor &monitor, deadline_type deadline,
                       std::optional<std::uint64_t> &sequence)
      : monitor_(monitor), deadline_(deadline), sequence_(sequence) {}

  bool ready_impl() const { return false; }
  bool suspend_impl(std::coroutine_handle<> h);
  bool resume_impl();

private:
  async_monitor &monitor_;
  deadline_type deadline_;
  std::optional<std::uint64_t> &sequence_;
  waiter_node node_;
};

// =============================================================================
// Async Monitor - Mutex with condition waits
// =============================================================================

class async_monitor : public primitive_base<async_monitor> {
  friend class monitor_wait_awaiter;

public:
  explicit async_monitor(std::shared_ptr<mutex_observer> observer = nullptr);

  template <typename F>
  auto synchronized(F fn) -> coro_task<task_result_t<F &>> {
    return lock_.synchronized(std::move(fn));
  }

  template <typename F> auto execute(F fn) -> coro_task<task_result_t<F &>> {
    return lock_.synchronized(std::move(fn));
  }

  // Must be called while holding the monitor. Returns false if the overall
  // timeout expired; the monitor is held again either way.
  coro_task<bool> wait_while(std::function<bool()> pred,
                             timeout_type timeout = std::nullopt);

  coro_task<bool> wait_until(std::function<bool()> pred,
                             timeout_type timeout = std::nullopt);

  void notify();
  void notify_all();

  std::size_t waiting_count() const;
  async_mutex &mutex() noexcept { return lock_; }

private:
  async_mutex lock_;
  wait_queue conditions_;
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_MONITOR_HPP
