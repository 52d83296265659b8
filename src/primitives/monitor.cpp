#include "flowgate/primitives/monitor.hpp"

#include <stdexcept>

namespace flowgate {

bool monitor_wait_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(monitor_.mutex_);
  node_.arm(h);
  if (sequence_) {
    node_.sequence = *sequence_;
    monitor_.conditions_.requeue(&node_);
  } else {
    monitor_.conditions_.push(&node_);
    sequence_ = node_.sequence;
  }
  node_.arm_deadline(deadline_);
  // Registered first, so a notify issued right after this cannot be missed
  monitor_.lock_.release();
  return true;
}

bool monitor_wait_awaiter::resume_impl() {
  std::lock_guard lock(monitor_.mutex_);
  node_.disarm_deadline();
  if (node_.status == wake_status::granted)
    return true;
  monitor_.conditions_.remove(&node_);
  return false;
}

async_monitor::async_monitor(std::shared_ptr<mutex_observer> observer)
    : lock_(mutex_options{std::nullopt, true, std::move(observer)}) {}

coro_task<bool> async_monitor::wait_while(std::function<bool()> pred,
                                          timeout_type timeout) {
  if (!lock_.is_locked())
    throw std::logic_error("wait_while requires holding the monitor");

  auto deadline = deadline_after(timeout);
  std::optional<std::uint64_t> sequence;
  while (pred()) {
    bool notified = co_await monitor_wait_awaiter(*this, deadline, sequence);
    co_await lock_.acquire();
    if (!notified)
      co_return false;
  }
  co_return true;
}

coro_task<bool> async_monitor::wait_until(std::function<bool()> pred,
                                          timeout_type timeout) {
  return wait_while([pred = std::move(pred)] { return !pred(); }, timeout);
}

void async_monitor::notify() {
  std::lock_guard lock(mutex_);
  conditions_.wake_next(wake_status::granted);
}

void async_monitor::notify_all() {
  std::lock_guard lock(mutex_);
  conditions_.wake_all(wake_status::granted);
}

std::size_t async_monitor::waiting_count() const {
  std::lock_guard lock(mutex_);
  return conditions_.size();
}

} // namespace flowgate
