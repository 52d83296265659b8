#include "flowgate/primitives/wait_queue.hpp"
#include "flowgate/task_scheduler.hpp"

#include <algorithm>

namespace flowgate {

bool wake_waiter(waiter_node *node, wake_status status,
                 std::exception_ptr error) {
  if (!node->gate.try_claim())
    return false;
  node->status = status;
  node->error = std::move(error);
  schedule_coro_handle(node->handle);
  return true;
}

wait_queue::wait_queue(queue_mode mode)
    : mode_(mode), nodes_(waiter_allocator<waiter_node *>()) {}

std::size_t wait_queue::push(waiter_node *node) {
  node->sequence = next_sequence_++;

  switch (mode_) {
  case queue_mode::fifo:
  case queue_mode::lifo:
    // lifo serves from the back, so the newest waiter is at position 1
    nodes_.push_back(node);
    return mode_ == queue_mode::fifo ? nodes_.size() : 1;
  case queue_mode::priority: {
    // Higher priority first; equal priorities keep arrival order
    auto it = std::upper_bound(
        nodes_.begin(), nodes_.end(), node,
        [](const waiter_node *a, const waiter_node *b) {
          return a->priority > b->priority;
        });
    it = nodes_.insert(it, node);
    return static_cast<std::size_t>(it - nodes_.begin()) + 1;
  }
  }
  return nodes_.size();
}

std::size_t wait_queue::requeue(waiter_node *node) {
  auto it = std::upper_bound(
      nodes_.begin(), nodes_.end(), node,
      [this](const waiter_node *a, const waiter_node *b) {
        if (mode_ == queue_mode::priority && a->priority != b->priority)
          return a->priority > b->priority;
        return a->sequence < b->sequence;
      });
  it = nodes_.insert(it, node);
  if (mode_ == queue_mode::lifo)
    return static_cast<std::size_t>(nodes_.end() - it);
  return static_cast<std::size_t>(it - nodes_.begin()) + 1;
}

std::size_t wait_queue::position_for(std::int64_t priority) const {
  switch (mode_) {
  case queue_mode::fifo:
    return nodes_.size() + 1;
  case queue_mode::lifo:
    return 1;
  case queue_mode::priority:
    return static_cast<std::size_t>(std::count_if(
               nodes_.begin(), nodes_.end(),
               [priority](const waiter_node *n) {
                 return n->priority >= priority;
               })) +
           1;
  }
  return nodes_.size() + 1;
}

waiter_node *wait_queue::pop() {
  if (nodes_.empty())
    return nullptr;
  waiter_node *node;
  if (mode_ == queue_mode::lifo) {
    node = nodes_.back();
    nodes_.pop_back();
  } else {
    node = nodes_.front();
    nodes_.pop_front();
  }
  return node;
}

bool wait_queue::remove(waiter_node *node) {
  auto it = std::find(nodes_.begin(), nodes_.end(), node);
  if (it == nodes_.end())
    return false;
  nodes_.erase(it);
  return true;
}

bool wait_queue::wake_next(wake_status status) {
  while (waiter_node *node = pop()) {
    if (wake_waiter(node, status))
      return true;
  }
  return false;
}

std::size_t wait_queue::wake_all(wake_status status, std::exception_ptr error) {
  std::size_t woken = 0;
  while (waiter_node *node = pop()) {
    if (wake_waiter(node, status, error))
      ++woken;
  }
  return woken;
}

} // namespace flowgate
