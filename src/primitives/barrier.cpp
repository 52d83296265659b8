#include "flowgate/primitives/barrier.hpp"
#include "flowgate/errors.hpp"

namespace flowgate {

bool barrier_wait_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(barrier_.mutex_);
  if (barrier_.broken_)
    throw broken_barrier_exception();

  if (++barrier_.arrived_ == barrier_.options_.parties) {
    barrier_.release_locked();
    return false;
  }

  node_.arm(h);
  barrier_.waiters_.push(&node_);
  node_.arm_deadline(deadline_after(barrier_.options_.timeout));
  return true;
}

void barrier_wait_awaiter::resume_impl() {
  {
    std::lock_guard lock(barrier_.mutex_);
    node_.disarm_deadline();
    if (node_.status == wake_status::granted)
      return;
    if (node_.status == wake_status::rejected)
      std::rethrow_exception(node_.error);

    // The timer won. If the node is gone the generation already released
    // without us; only this caller times out.
    if (!barrier_.waiters_.remove(&node_))
      throw timeout_exception("barrier timeout");

    barrier_.broken_ = true;
    barrier_.arrived_ = 0;
    barrier_.waiters_.wake_all(
        wake_status::rejected,
        std::make_exception_ptr(timeout_exception("barrier timeout")));
  }
  barrier_.options_.observer->on_timeout();
  throw timeout_exception("barrier timeout");
}

async_barrier::async_barrier(barrier_options options)
    : options_(std::move(options)) {
  if (options_.parties == 0)
    throw invalid_configuration_exception(
        "barrier parties must be greater than zero");
  if (!options_.observer)
    options_.observer = std::make_shared<barrier_observer>();
}

void async_barrier::release_locked() {
  if (options_.action) {
    try {
      options_.action();
    } catch (...) {
      broken_ = true;
      arrived_ = 0;
      waiters_.wake_all(wake_status::rejected,
                        std::make_exception_ptr(broken_barrier_exception(
                            "barrier action failed")));
      throw;
    }
  }

  waiters_.wake_all(wake_status::granted);
  if (options_.cyclic)
    arrived_ = 0;
  else
    broken_ = true;
}

void async_barrier::reset() {
  std::lock_guard lock(mutex_);
  arrived_ = 0;
  broken_ = false;
  waiters_.wake_all(wake_status::rejected,
                    std::make_exception_ptr(
                        broken_barrier_exception("barrier was reset")));
}

std::size_t async_barrier::arrived_count() const {
  std::lock_guard lock(mutex_);
  return arrived_;
}

bool async_barrier::is_broken() const {
  std::lock_guard lock(mutex_);
  return broken_;
}

} // namespace flowgate
