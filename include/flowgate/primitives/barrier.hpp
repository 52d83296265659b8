#ifndef FLOWGATE_PRIMITIVES_BARRIER_HPP
#define FLOWGATE_PRIMITIVES_BARRIER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>

#include "../coro_task.hpp"
#include "crtp_base.hpp"
#include "wait_queue.hpp"

namespace flowgate {

struct barrier_observer {
  virtual ~barrier_observer() = default;
  virtual void on_timeout() {}
};

struct barrier_options {
  std::size_t parties = 0;
  bool cyclic = false;
  // Runs once per release on the completing party, under the barrier lock.
  // It must not call back into the barrier.
  std::function<void()> action;
  timeout_type timeout;
  std::shared_ptr<barrier_observer> observer;
};

class async_barrier;

class barrier_wait_awaiter : public awaitable_base<barrier_wait_awaiter, void> {
public:
  explicit barrier_wait_awaiter(async_barrier &barrier) : barrier_(barrier) {}

  bool ready_impl() const { return false; }
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  async_barrier &barrier_;
  waiter_node node_;
};

// =============================================================================
// Async Barrier - Rendezvous of a fixed number of parties
// =============================================================================

class async_barrier : public primitive_base<async_barrier> {
  friend class barrier_wait_awaiter;

public:
  explicit async_barrier(barrier_options options);

  [[nodiscard]] barrier_wait_awaiter arrive_and_wait() {
    return barrier_wait_awaiter(*this);
  }

  // Run fn, then arrive; fn's result is returned once the barrier releases
  template <typename F> auto execute(F fn) -> coro_task<task_result_t<F &>> {
    using result_type = task_result_t<F &>;
    if constexpr (std::is_void_v<result_type>) {
      co_await fn();
      co_await arrive_and_wait();
    } else {
      result_type result = co_await fn();
      co_await arrive_and_wait();
      co_return result;
    }
  }

  void reset();

  std::size_t arrived_count() const;
  bool is_broken() const;
  std::size_t parties() const noexcept { return options_.parties; }
  bool is_cyclic() const noexcept { return options_.cyclic; }

private:
  // Completing arrival: run the action and release every waiter
  void release_locked();

  barrier_options options_;
  std::size_t arrived_{0};
  bool broken_{false};
  wait_queue waiters_;
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_BARRIER_HPP
