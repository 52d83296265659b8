#include "flowgate/control/function_queue.hpp"
#include "flowgate/errors.hpp"

#include <stdexcept>

namespace flowgate {

bool queue_slot_awaiter::ready_impl() {
  std::size_t size_after;
  {
    std::lock_guard lock(queue_.mutex_);
    const auto &limit = queue_.options_.max_queue_size;
    if (limit && queue_.pending_.size() >= *limit)
      throw capacity_exceeded_exception("queue full");
    size_after = queue_.pending_.size() + 1;
  }
  queue_.options_.observer->on_queue_change(size_after);
  return false;
}

bool queue_slot_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(queue_.mutex_);
  const auto &limit = queue_.options_.max_queue_size;
  if (limit && queue_.pending_.size() >= *limit)
    throw capacity_exceeded_exception("queue full");

  call_.arm(h);
  call_.priority = priority_;
  queue_.pending_.push(&call_);
  // May resume this very call when a slot is free
  queue_.dispatch_locked();
  return true;
}

void queue_slot_awaiter::resume_impl() {
  queue_.options_.observer->on_queue_change(call_.remaining);
}

function_queue::function_queue(function_queue_options options)
    : options_(std::move(options)), pending_(options_.mode) {
  if (options_.concurrency == 0)
    throw invalid_configuration_exception(
        "function queue concurrency must be greater than zero");
  if (options_.max_queue_size && *options_.max_queue_size == 0)
    throw invalid_configuration_exception(
        "function queue max_queue_size must be greater than zero");
  if (!options_.observer)
    options_.observer = std::make_shared<queue_observer>();
}

void function_queue::dispatch_locked() {
  while (running_ < options_.concurrency) {
    waiter_node *next = pending_.pop();
    if (!next)
      break;
    static_cast<queued_call *>(next)->remaining = pending_.size();
    if (wake_waiter(next, wake_status::granted))
      ++running_;
  }
}

void function_queue::finish() {
  std::lock_guard lock(mutex_);
  if (running_ == 0)
    throw std::logic_error("function queue finish without a running task");
  --running_;
  dispatch_locked();
}

std::size_t function_queue::queue_length() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

std::size_t function_queue::running_tasks() const {
  std::lock_guard lock(mutex_);
  return running_;
}

} // namespace flowgate
