#include "flowgate/primitives/countdown_latch.hpp"
#include "flowgate/errors.hpp"

namespace flowgate {

bool latch_wait_awaiter::ready_impl() {
  std::lock_guard lock(latch_.mutex_);
  completed_early_ = latch_.remaining_ == 0;
  return completed_early_;
}

bool latch_wait_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(latch_.mutex_);
  if (latch_.remaining_ == 0) {
    completed_early_ = true;
    return false;
  }
  node_.arm(h);
  latch_.waiters_.push(&node_);
  node_.arm_deadline(deadline_);
  return true;
}

bool latch_wait_awaiter::resume_impl() {
  if (completed_early_)
    return true;
  std::lock_guard lock(latch_.mutex_);
  node_.disarm_deadline();
  if (node_.status == wake_status::granted)
    return true;
  latch_.waiters_.remove(&node_);
  return false;
}

async_countdown_latch::async_countdown_latch(
    std::size_t count, std::shared_ptr<latch_observer> observer)
    : initial_(count), remaining_(count),
      observer_(observer ? std::move(observer)
                         : std::make_shared<latch_observer>()) {}

void async_countdown_latch::count_down() {
  {
    std::lock_guard lock(mutex_);
    if (remaining_ == 0)
      throw latch_underflow_exception();
    if (--remaining_ != 0)
      return;
  }

  // Waiters are released even if the observer throws
  std::exception_ptr observer_error;
  try {
    observer_->on_complete();
  } catch (...) {
    observer_error = std::current_exception();
  }
  {
    std::lock_guard lock(mutex_);
    waiters_.wake_all(wake_status::granted);
  }
  if (observer_error)
    std::rethrow_exception(observer_error);
}

void async_countdown_latch::reset() {
  std::lock_guard lock(mutex_);
  remaining_ = initial_;
}

std::size_t async_countdown_latch::count() const {
  std::lock_guard lock(mutex_);
  return remaining_;
}

bool async_countdown_latch::is_complete() const {
  std::lock_guard lock(mutex_);
  return remaining_ == 0;
}

} // namespace flowgate
