#ifndef FLOWGATE_PRIMITIVES_WAIT_QUEUE_HPP
#define FLOWGATE_PRIMITIVES_WAIT_QUEUE_HPP

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory_resource>
#include <optional>

#include "../timer_service.hpp"
#include "../wake_gate.hpp"

namespace flowgate {

// =============================================================================
// Queue Modes and Timeouts
// =============================================================================

// fifo serves strictly in arrival order; lifo and priority do not.
enum class queue_mode { fifo, lifo, priority };

// Optional bound on a wait; std::nullopt waits forever
using timeout_type = std::optional<std::chrono::milliseconds>;
using deadline_type = std::optional<std::chrono::steady_clock::time_point>;

inline deadline_type deadline_after(timeout_type timeout) {
  if (!timeout)
    return std::nullopt;
  return std::chrono::steady_clock::now() + *timeout;
}

// =============================================================================
// Waiter Node
// =============================================================================
//
// Lives in the suspended caller's coroutine frame. A node sits in at most one
// wait_queue, and only while its frame is alive: whoever wakes it pops it
// first, and an owner resumed by its timer removes it under the primitive
// mutex before returning.

enum class wake_status { pending, granted, timed_out, rejected };

struct waiter_node {
  std::coroutine_handle<> handle{nullptr};
  wake_gate gate;
  wake_status status{wake_status::pending};
  std::exception_ptr error;
  std::int64_t priority{0};
  std::uint64_t sequence{0};
  std::chrono::steady_clock::time_point enqueued_at{};
  timer_id timer{0};

  // Prepare for a new suspension
  void arm(std::coroutine_handle<> h) {
    handle = h;
    gate = wake_gate::make();
    status = wake_status::pending;
    error = nullptr;
    enqueued_at = std::chrono::steady_clock::now();
    timer = 0;
  }

  // Register the deadline with the timer_service. Caller holds the
  // primitive mutex, so the owner cannot observe `timer` before it is set.
  void arm_deadline(const deadline_type &deadline) {
    if (deadline)
      timer = get_timer_service().add_timer(*deadline, handle, gate);
  }

  void disarm_deadline() {
    if (timer != 0) {
      get_timer_service().cancel_timer(timer);
      timer = 0;
    }
  }
};

// Resume a waiter with the given outcome. Returns false if its timer (or a
// cancellation) already claimed it. Caller holds the primitive mutex.
bool wake_waiter(waiter_node *node, wake_status status,
                 std::exception_ptr error = nullptr);

// =============================================================================
// Wait Queue
// =============================================================================
//
// Ordered collection of suspended waiters. Not synchronized: every call is
// made under the owning primitive's mutex.

class wait_queue {
public:
  explicit wait_queue(queue_mode mode = queue_mode::fifo);

  wait_queue(const wait_queue &) = delete;
  wait_queue &operator=(const wait_queue &) = delete;

  // Insert per mode; returns the 1-based service position of the node
  std::size_t push(waiter_node *node);

  // Re-insert a node that was served before, keeping its original sequence
  // so it ranks ahead of waiters that arrived after it
  std::size_t requeue(waiter_node *node);

  // Position a new waiter with this priority would take, without inserting
  std::size_t position_for(std::int64_t priority) const;

  // Remove and return the next node to serve, or nullptr
  waiter_node *pop();

  // Remove a specific node (timeout path). False if it was not queued.
  bool remove(waiter_node *node);

  // Wake the next claimable waiter. Abandoned (timed-out) nodes are dropped.
  bool wake_next(wake_status status = wake_status::granted);

  // Wake every queued waiter; returns how many were resumed
  std::size_t wake_all(wake_status status = wake_status::granted,
                       std::exception_ptr error = nullptr);

  std::size_t size() const noexcept { return nodes_.size(); }
  bool empty() const noexcept { return nodes_.empty(); }
  queue_mode mode() const noexcept { return mode_; }

private:
  queue_mode mode_;
  std::pmr::deque<waiter_node *> nodes_;
  std::uint64_t next_sequence_{0};
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_WAIT_QUEUE_HPP
