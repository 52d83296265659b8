#ifndef FLOWGATE_CONTROL_BACKPRESSURE_HPP
#define FLOWGATE_CONTROL_BACKPRESSURE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <utility>

#include "../coro_task.hpp"
#include "../primitives/crtp_base.hpp"
#include "../primitives/wait_queue.hpp"

namespace flowgate {

enum class backpressure_strategy {
  drop,
  drop_oldest,
  buffer,
  sample,
  throttle,
  error
};

struct backpressure_observer {
  virtual ~backpressure_observer() = default;

  // Work was refused or evicted because the controller was saturated. For
  // drop_oldest this fires on the evicted caller.
  virtual void on_overflow() {}
  virtual void on_buffer_full() {}
};

struct backpressure_options {
  backpressure_strategy strategy = backpressure_strategy::buffer;
  std::size_t buffer_size = 100;
  double sample_rate = 0.1;
  std::size_t max_concurrent = 10;
  std::optional<std::uint64_t> seed;
  std::shared_ptr<backpressure_observer> observer;
};

class backpressure_controller;

class admission_awaiter : public awaitable_base<admission_awaiter, void> {
public:
  explicit admission_awaiter(backpressure_controller &controller)
      : controller_(controller) {}

  bool ready_impl() const { return false; }
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  backpressure_controller &controller_;
  waiter_node node_;
};

// Holds one execution slot; finishing it lets buffered work in
class backpressure_slot {
public:
  backpressure_slot() = default;
  explicit backpressure_slot(backpressure_controller &controller) noexcept
      : controller_(&controller) {}

  backpressure_slot(const backpressure_slot &) = delete;
  backpressure_slot &operator=(const backpressure_slot &) = delete;

  backpressure_slot(backpressure_slot &&other) noexcept
      : controller_(std::exchange(other.controller_, nullptr)) {}

  backpressure_slot &operator=(backpressure_slot &&other) noexcept {
    if (this != &other) {
      reset();
      controller_ = std::exchange(other.controller_, nullptr);
    }
    return *this;
  }

  ~backpressure_slot() { reset(); }

  void reset();

private:
  backpressure_controller *controller_{nullptr};
};

// =============================================================================
// Backpressure Controller
// =============================================================================

class backpressure_controller : public primitive_base<backpressure_controller> {
  friend class admission_awaiter;

public:
  explicit backpressure_controller(backpressure_options options);

  // Wait for an execution slot per the strategy; pair with finish()
  [[nodiscard]] admission_awaiter admit() { return admission_awaiter(*this); }

  void finish();

  template <typename F> auto execute(F fn) -> coro_task<task_result_t<F &>> {
    co_await admit();
    backpressure_slot slot(*this);
    co_return co_await fn();
  }

  // Callers waiting for a slot, including throttled ones waiting for space
  std::size_t buffer_size() const;
  std::size_t active_executions() const;
  bool is_under_pressure() const;
  backpressure_strategy strategy() const noexcept { return options_.strategy; }
  std::size_t max_concurrent() const noexcept { return options_.max_concurrent; }
  std::size_t buffer_capacity() const noexcept { return options_.buffer_size; }

private:
  bool buffer_has_room_locked() const {
    return buffer_.size() < options_.buffer_size;
  }
  bool sample_locked() { return sampler_(rng_) < options_.sample_rate; }
  void grant_locked();

  backpressure_options options_;
  std::size_t active_{0};
  wait_queue buffer_;
  // throttle only: callers waiting for buffer space
  wait_queue overflow_;
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> sampler_{0.0, 1.0};
};

} // namespace flowgate

#endif // FLOWGATE_CONTROL_BACKPRESSURE_HPP
