#ifndef FLOWGATE_CONTROL_RATE_LIMITER_HPP
#define FLOWGATE_CONTROL_RATE_LIMITER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <optional>

#include "../cancellation.hpp"
#include "../coro_task.hpp"
#include "../primitives/crtp_base.hpp"
#include "../primitives/wait_queue.hpp"

namespace flowgate {

enum class rate_limit_strategy {
  token_bucket,
  leaky_bucket,
  fixed_window,
  sliding_window
};

struct rate_limiter_options {
  std::size_t max_calls = 0;
  std::chrono::milliseconds window{0};
  rate_limit_strategy strategy = rate_limit_strategy::token_bucket;
};

class rate_limiter;

// Leaky-bucket admission: wait for the ticker to release this caller
class leak_wait_awaiter : public awaitable_base<leak_wait_awaiter, void> {
public:
  leak_wait_awaiter(rate_limiter &limiter, deadline_type deadline)
      : limiter_(limiter), deadline_(deadline) {}

  bool ready_impl() const { return false; }
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  rate_limiter &limiter_;
  deadline_type deadline_;
  waiter_node node_;
};

// =============================================================================
// Rate Limiter
// =============================================================================
//
// Admits at most max_calls per window. Limits are fixed at construction.
// A leaky_bucket limiter owns a ticker coroutine that releases one queued
// caller every window / max_calls; it is stopped by dispose() or the
// destructor, which must not run on a worker thread. The destructor waits
// for rejected leaky waiters to resume before releasing the limiter.

class rate_limiter : public primitive_base<rate_limiter> {
  friend class leak_wait_awaiter;

public:
  explicit rate_limiter(rate_limiter_options options);
  ~rate_limiter();

  // Wait for admission. Throws timeout_exception if admission would come
  // after the timeout, cancelled_exception once disposed.
  coro_task<void> acquire(timeout_type timeout = std::nullopt);

  template <typename F>
  auto execute(F fn, timeout_type timeout = std::nullopt)
      -> coro_task<task_result_t<F &>> {
    co_await acquire(timeout);
    co_return co_await fn();
  }

  void reset();
  void dispose();

  std::size_t available_tokens() const;
  std::size_t window_count() const;
  std::size_t queue_length() const;
  rate_limit_strategy strategy() const noexcept { return options_.strategy; }
  std::size_t max_calls() const noexcept { return options_.max_calls; }
  std::chrono::milliseconds window() const noexcept { return options_.window; }
  bool is_disposed() const;

private:
  using clock = std::chrono::steady_clock;

  // Admit now (returns nullopt) or report how long to wait before retrying
  std::optional<clock::duration> try_admit_locked(clock::time_point now);
  void refill_locked(clock::time_point now);
  void trim_window_locked(clock::time_point now);

  coro_task<void> run_leak_ticker();

  rate_limiter_options options_;
  clock::duration leak_interval_;
  std::size_t tokens_;
  clock::time_point last_refill_;
  std::deque<clock::time_point> admissions_;
  wait_queue leak_queue_;
  // Leaky waiters suspended on this limiter and not yet resumed
  std::size_t leak_waiters_{0};
  std::condition_variable leak_drained_;
  bool disposed_{false};
  cancellation_source stop_;
  // Declared last: destroyed first, while the state it touches still exists
  std::optional<coro_task<void>> ticker_;
};

} // namespace flowgate

#endif // FLOWGATE_CONTROL_RATE_LIMITER_HPP
