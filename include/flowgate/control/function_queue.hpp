#ifndef FLOWGATE_CONTROL_FUNCTION_QUEUE_HPP
#define FLOWGATE_CONTROL_FUNCTION_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "../coro_task.hpp"
#include "../primitives/crtp_base.hpp"
#include "../primitives/wait_queue.hpp"

namespace flowgate {

struct queue_observer {
  virtual ~queue_observer() = default;

  // Queue length after an enqueue or a dequeue
  virtual void on_queue_change(std::size_t size) { (void)size; }
};

struct function_queue_options {
  std::size_t concurrency = 1;
  queue_mode mode = queue_mode::fifo;
  std::optional<std::size_t> max_queue_size;
  std::shared_ptr<queue_observer> observer;
};

class function_queue;

// Every call passes through the queue, even when a slot is free
struct queued_call : waiter_node {
  std::size_t remaining{0};
};

class queue_slot_awaiter : public awaitable_base<queue_slot_awaiter, void> {
public:
  queue_slot_awaiter(function_queue &queue, std::int64_t priority)
      : queue_(queue), priority_(priority) {}

  bool ready_impl();
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  function_queue &queue_;
  std::int64_t priority_;
  queued_call call_;
};

// =============================================================================
// Function Queue - Ordered execution with bounded parallelism
// =============================================================================

class function_queue : public primitive_base<function_queue> {
  friend class queue_slot_awaiter;

  class running_slot {
  public:
    explicit running_slot(function_queue &queue) : queue_(queue) {}
    running_slot(const running_slot &) = delete;
    running_slot &operator=(const running_slot &) = delete;
    ~running_slot() { queue_.finish(); }

  private:
    function_queue &queue_;
  };

public:
  explicit function_queue(function_queue_options options);

  template <typename F>
  auto execute(F fn, std::int64_t priority = 0)
      -> coro_task<task_result_t<F &>> {
    co_await queue_slot_awaiter(*this, priority);
    running_slot slot(*this);
    co_return co_await fn();
  }

  std::size_t queue_length() const;
  std::size_t running_tasks() const;
  std::size_t concurrency() const noexcept { return options_.concurrency; }
  queue_mode mode() const noexcept { return pending_.mode(); }

private:
  void dispatch_locked();
  void finish();

  function_queue_options options_;
  wait_queue pending_;
  std::size_t running_{0};
};

} // namespace flowgate

#endif // FLOWGATE_CONTROL_FUNCTION_QUEUE_HPP
