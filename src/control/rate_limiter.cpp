#include "flowgate/control/rate_limiter.hpp"
#include "flowgate/errors.hpp"
#include "flowgate/sleep.hpp"

#include <algorithm>
#include <cstdio>

namespace flowgate {

// =============================================================================
// leak_wait_awaiter
// =============================================================================

bool leak_wait_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(limiter_.mutex_);
  if (limiter_.disposed_)
    throw cancelled_exception("rate limiter disposed");
  node_.arm(h);
  limiter_.leak_queue_.push(&node_);
  ++limiter_.leak_waiters_;
  node_.arm_deadline(deadline_);
  return true;
}

void leak_wait_awaiter::resume_impl() {
  std::lock_guard lock(limiter_.mutex_);
  node_.disarm_deadline();
  // The limiter may be destroyed once this lock is released
  if (--limiter_.leak_waiters_ == 0)
    limiter_.leak_drained_.notify_all();
  if (node_.status == wake_status::granted)
    return;
  if (node_.status == wake_status::rejected)
    std::rethrow_exception(node_.error);
  limiter_.leak_queue_.remove(&node_);
  throw timeout_exception("rate limiter admission timed out");
}

// =============================================================================
// rate_limiter
// =============================================================================

rate_limiter::rate_limiter(rate_limiter_options options)
    : options_(options), leak_interval_(0), tokens_(options.max_calls),
      last_refill_(clock::now()), leak_queue_(queue_mode::fifo) {
  if (options_.max_calls == 0)
    throw invalid_configuration_exception(
        "rate limiter max_calls must be greater than zero");
  if (options_.window <= std::chrono::milliseconds::zero())
    throw invalid_configuration_exception(
        "rate limiter window must be positive");

  if (options_.strategy == rate_limit_strategy::leaky_bucket) {
    leak_interval_ =
        std::max<clock::duration>(clock::duration(options_.window) /
                                      static_cast<long>(options_.max_calls),
                                  std::chrono::microseconds(1));
    ticker_.emplace(run_leak_ticker());
    ticker_->start();
  }
}

rate_limiter::~rate_limiter() {
  dispose();
  {
    std::unique_lock lock(mutex_);
    leak_drained_.wait(lock, [this] { return leak_waiters_ == 0; });
  }
  // Blocks until the ticker observed the stop request
  ticker_.reset();
}

coro_task<void> rate_limiter::acquire(timeout_type timeout) {
  auto deadline = deadline_after(timeout);

  if (options_.strategy == rate_limit_strategy::leaky_bucket) {
    co_await leak_wait_awaiter(*this, deadline);
    co_return;
  }

  while (true) {
    clock::duration wait;
    {
      std::lock_guard lock(mutex_);
      if (disposed_)
        throw cancelled_exception("rate limiter disposed");
      auto next = try_admit_locked(clock::now());
      if (!next)
        break;
      wait = *next;
    }

    if (deadline && clock::now() + wait > *deadline) {
      // Admission would land past the deadline: wait out the timeout, then fail
      if (co_await sleep_until(*deadline, stop_.token()) ==
          sleep_status::cancelled)
        throw cancelled_exception("rate limiter disposed");
      throw timeout_exception("rate limiter admission timed out");
    }

    if (co_await sleep(wait, stop_.token()) == sleep_status::cancelled)
      throw cancelled_exception("rate limiter disposed");
  }
}

std::optional<rate_limiter::clock::duration>
rate_limiter::try_admit_locked(clock::time_point now) {
  const clock::duration window = options_.window;

  switch (options_.strategy) {
  case rate_limit_strategy::token_bucket:
    refill_locked(now);
    if (tokens_ > 0) {
      --tokens_;
      return std::nullopt;
    }
    return window - (now - last_refill_);

  case rate_limit_strategy::fixed_window:
  case rate_limit_strategy::sliding_window: {
    trim_window_locked(now);
    if (admissions_.size() < options_.max_calls) {
      admissions_.push_back(now);
      return std::nullopt;
    }
    clock::duration wait = window - (now - admissions_.front());
    if (options_.strategy == rate_limit_strategy::sliding_window)
      wait += std::chrono::milliseconds(1);
    return wait;
  }

  case rate_limit_strategy::leaky_bucket:
    break;
  }
  return std::nullopt;
}

void rate_limiter::refill_locked(clock::time_point now) {
  const clock::duration window = options_.window;
  auto elapsed = now - last_refill_;
  if (elapsed < window)
    return;
  // Whole windows only, so the refill cadence does not drift
  last_refill_ += window * (elapsed / window);
  tokens_ = options_.max_calls;
}

void rate_limiter::trim_window_locked(clock::time_point now) {
  const clock::duration window = options_.window;
  while (!admissions_.empty() && now - admissions_.front() >= window)
    admissions_.pop_front();
}

coro_task<void> rate_limiter::run_leak_ticker() {
  auto token = stop_.token();
  auto next = clock::now() + leak_interval_;
  while (true) {
    if (co_await sleep_until(next, token) == sleep_status::cancelled)
      co_return;
    {
      std::lock_guard lock(mutex_);
      leak_queue_.wake_next(wake_status::granted);
    }
    // Missed ticks are skipped rather than replayed as a burst
    auto now = clock::now();
    next += leak_interval_;
    if (next <= now)
      next = now + leak_interval_;
  }
}

void rate_limiter::reset() {
  std::lock_guard lock(mutex_);
  tokens_ = options_.max_calls;
  last_refill_ = clock::now();
  admissions_.clear();
  leak_queue_.wake_all(
      wake_status::rejected,
      std::make_exception_ptr(cancelled_exception("rate limiter reset")));
}

void rate_limiter::dispose() {
  std::size_t pending = 0;
  {
    std::lock_guard lock(mutex_);
    if (disposed_)
      return;
    disposed_ = true;
    pending = leak_queue_.wake_all(
        wake_status::rejected,
        std::make_exception_ptr(cancelled_exception("rate limiter disposed")));
  }
  if (pending > 0)
    std::fprintf(stderr, "[rate_limiter] disposed with %zu pending waiter(s)\n",
                 pending);
  stop_.cancel();
}

std::size_t rate_limiter::available_tokens() const {
  std::lock_guard lock(mutex_);
  auto now = clock::now();
  const clock::duration window = options_.window;
  switch (options_.strategy) {
  case rate_limit_strategy::token_bucket:
    return now - last_refill_ >= window ? options_.max_calls : tokens_;
  case rate_limit_strategy::fixed_window:
  case rate_limit_strategy::sliding_window: {
    auto live = static_cast<std::size_t>(
        std::count_if(admissions_.begin(), admissions_.end(),
                      [&](clock::time_point t) { return now - t < window; }));
    return options_.max_calls - std::min(live, options_.max_calls);
  }
  case rate_limit_strategy::leaky_bucket:
    // Admission is paced by the ticker, never banked
    return 0;
  }
  return 0;
}

std::size_t rate_limiter::window_count() const {
  std::lock_guard lock(mutex_);
  auto now = clock::now();
  const clock::duration window = options_.window;
  return static_cast<std::size_t>(
      std::count_if(admissions_.begin(), admissions_.end(),
                    [&](clock::time_point t) { return now - t < window; }));
}

std::size_t rate_limiter::queue_length() const {
  std::lock_guard lock(mutex_);
  return leak_queue_.size();
}

bool rate_limiter::is_disposed() const {
  std::lock_guard lock(mutex_);
  return disposed_;
}

} // namespace flowgate
