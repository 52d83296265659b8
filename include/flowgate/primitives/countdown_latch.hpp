#ifndef FLOWGATE_PRIMITIVES_COUNTDOWN_LATCH_HPP
#define FLOWGATE_PRIMITIVES_COUNTDOWN_LATCH_HPP

#include <cstddef>
#include <memory>
#include <type_traits>

#include "../coro_task.hpp"
#include "crtp_base.hpp"
#include "wait_queue.hpp"

namespace flowgate {

struct latch_observer {
  virtual ~latch_observer() = default;

  // The count reached zero; fires before waiters resume
  virtual void on_complete() {}
};

class async_countdown_latch;

class latch_wait_awaiter : public awaitable_base<latch_wait_awaiter, bool> {
public:
  latch_wait_awaiter(async_countdown_latch &latch, deadline_type deadline)
      : latch_(latch), deadline_(deadline) {}

  bool ready_impl();
  bool suspend_impl(std::coroutine_handle<> h);
  bool resume_impl();

private:
  async_countdown_latch &latch_;
  deadline_type deadline_;
  waiter_node node_;
  bool completed_early_{false};
};

// =============================================================================
// Async Countdown Latch
// =============================================================================

class async_countdown_latch : public primitive_base<async_countdown_latch> {
  friend class latch_wait_awaiter;

public:
  explicit async_countdown_latch(
      std::size_t count, std::shared_ptr<latch_observer> observer = nullptr);

  void count_down();

  // True once the count is zero; false if the timeout expired first
  [[nodiscard]] latch_wait_awaiter wait(timeout_type timeout = std::nullopt) {
    return latch_wait_awaiter(*this, deadline_after(timeout));
  }

  void reset();

  template <typename F> auto execute(F fn) -> coro_task<task_result_t<F &>> {
    using result_type = task_result_t<F &>;
    if constexpr (std::is_void_v<result_type>) {
      co_await fn();
      count_down();
    } else {
      result_type result = co_await fn();
      count_down();
      co_return result;
    }
  }

  std::size_t count() const;
  std::size_t initial_count() const noexcept { return initial_; }
  bool is_complete() const;

private:
  std::size_t initial_;
  std::size_t remaining_;
  wait_queue waiters_;
  std::shared_ptr<latch_observer> observer_;
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_COUNTDOWN_LATCH_HPP
