#include "flowgate/primitives/semaphore.hpp"
#include "flowgate/errors.hpp"

#include <stdexcept>

namespace flowgate {

namespace {

std::shared_ptr<semaphore_observer>
observer_or_default(std::shared_ptr<semaphore_observer> observer) {
  if (observer)
    return observer;
  return std::make_shared<semaphore_observer>();
}

} // namespace

// =============================================================================
// semaphore_acquire_awaiter
// =============================================================================

bool semaphore_acquire_awaiter::ready_impl() {
  std::size_t position;
  {
    std::lock_guard lock(sem_.mutex_);
    if (sem_.take_locked())
      return true;
    position = sem_.waiters_.position_for(priority_);
  }
  // Nothing is registered yet, so an observer exception leaves no trace
  sem_.observer_->on_waiting(position);
  return false;
}

bool semaphore_acquire_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(sem_.mutex_);
  // A permit may have come back while the observer ran
  if (sem_.take_locked())
    return false;

  node_.arm(h);
  node_.priority = priority_;
  sem_.waiters_.push(&node_);
  node_.arm_deadline(deadline_);
  return true;
}

void semaphore_acquire_awaiter::resume_impl() {
  std::lock_guard lock(sem_.mutex_);
  node_.disarm_deadline();
  if (node_.status == wake_status::granted)
    return;
  // Only the timer resumes without a status; the permit was never ours
  sem_.waiters_.remove(&node_);
  throw timeout_exception("semaphore acquire timed out");
}

// =============================================================================
// semaphore_permit
// =============================================================================

void semaphore_permit::reset() {
  if (sem_) {
    std::exchange(sem_, nullptr)->release();
  }
}

// =============================================================================
// async_semaphore
// =============================================================================

async_semaphore::async_semaphore(std::size_t capacity, queue_mode mode,
                                 std::shared_ptr<semaphore_observer> observer)
    : capacity_(capacity), waiters_(mode),
      observer_(observer_or_default(std::move(observer))) {
  if (capacity_ == 0)
    throw invalid_configuration_exception(
        "semaphore capacity must be greater than zero");
}

bool async_semaphore::try_acquire() {
  std::lock_guard lock(mutex_);
  return take_locked();
}

void async_semaphore::release() {
  std::lock_guard lock(mutex_);
  // The permit passes straight to the next waiter; held_ is unchanged
  if (waiters_.wake_next(wake_status::granted))
    return;
  if (held_ == 0)
    throw std::logic_error("semaphore released more times than acquired");
  --held_;
}

coro_task<semaphore_permit>
async_semaphore::scoped_acquire(timeout_type timeout, std::int64_t priority) {
  co_await acquire(timeout, priority);
  co_return semaphore_permit(*this);
}

std::size_t async_semaphore::available_permits() const {
  std::lock_guard lock(mutex_);
  return capacity_ - held_;
}

std::size_t async_semaphore::queue_length() const {
  std::lock_guard lock(mutex_);
  return waiters_.size();
}

} // namespace flowgate
