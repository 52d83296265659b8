#include "flowgate/control/backpressure.hpp"
#include "flowgate/errors.hpp"

#include <stdexcept>

namespace flowgate {

namespace {

enum class admission { wait, overflow, buffer_full };

} // namespace

// =============================================================================
// admission_awaiter
// =============================================================================

bool admission_awaiter::suspend_impl(std::coroutine_handle<> h) {
  auto &c = controller_;
  admission outcome = admission::wait;
  {
    std::lock_guard lock(c.mutex_);
    if (c.active_ < c.options_.max_concurrent) {
      ++c.active_;
      return false;
    }

    wait_queue *target = &c.buffer_;
    switch (c.options_.strategy) {
    case backpressure_strategy::drop:
    case backpressure_strategy::error:
      outcome = admission::overflow;
      break;
    case backpressure_strategy::buffer:
      if (!c.buffer_has_room_locked())
        outcome = admission::buffer_full;
      break;
    case backpressure_strategy::sample:
      if (!c.sample_locked() || !c.buffer_has_room_locked())
        outcome = admission::overflow;
      break;
    case backpressure_strategy::drop_oldest:
      if (!c.buffer_has_room_locked()) {
        // The evicted caller reports the overflow when it resumes
        wake_waiter(c.buffer_.pop(), wake_status::rejected,
                    std::make_exception_ptr(
                        cancelled_exception("dropped as oldest in buffer")));
      }
      break;
    case backpressure_strategy::throttle:
      if (!c.buffer_has_room_locked())
        target = &c.overflow_;
      break;
    }

    if (outcome == admission::wait) {
      node_.arm(h);
      target->push(&node_);
      return true;
    }
  }

  // Nothing was registered; report and refuse
  if (outcome == admission::buffer_full) {
    c.options_.observer->on_buffer_full();
    throw capacity_exceeded_exception("backpressure buffer full");
  }
  c.options_.observer->on_overflow();
  throw capacity_exceeded_exception("backpressure overflow");
}

void admission_awaiter::resume_impl() {
  if (node_.status == wake_status::granted)
    return;
  controller_.options_.observer->on_overflow();
  std::rethrow_exception(node_.error);
}

void backpressure_slot::reset() {
  if (controller_)
    std::exchange(controller_, nullptr)->finish();
}

// =============================================================================
// backpressure_controller
// =============================================================================

backpressure_controller::backpressure_controller(backpressure_options options)
    : options_(std::move(options)), buffer_(queue_mode::fifo),
      overflow_(queue_mode::fifo),
      rng_(options_.seed ? *options_.seed : std::random_device{}()) {
  if (options_.buffer_size == 0)
    throw invalid_configuration_exception(
        "backpressure buffer_size must be greater than zero");
  if (options_.max_concurrent == 0)
    throw invalid_configuration_exception(
        "backpressure max_concurrent must be greater than zero");
  if (!(options_.sample_rate >= 0.0 && options_.sample_rate <= 1.0))
    throw invalid_configuration_exception(
        "backpressure sample_rate must be within [0, 1]");
  if (!options_.observer)
    options_.observer = std::make_shared<backpressure_observer>();
}

void backpressure_controller::finish() {
  std::lock_guard lock(mutex_);
  if (active_ == 0)
    throw std::logic_error("backpressure finish without an admitted run");
  --active_;
  grant_locked();
}

void backpressure_controller::grant_locked() {
  while (true) {
    // Throttled callers move up behind the buffered ones
    while (buffer_has_room_locked() && !overflow_.empty())
      buffer_.push(overflow_.pop());
    if (active_ >= options_.max_concurrent ||
        !buffer_.wake_next(wake_status::granted))
      return;
    ++active_;
  }
}

std::size_t backpressure_controller::buffer_size() const {
  std::lock_guard lock(mutex_);
  return buffer_.size() + overflow_.size();
}

std::size_t backpressure_controller::active_executions() const {
  std::lock_guard lock(mutex_);
  return active_;
}

bool backpressure_controller::is_under_pressure() const {
  std::lock_guard lock(mutex_);
  return active_ >= options_.max_concurrent;
}

} // namespace flowgate
