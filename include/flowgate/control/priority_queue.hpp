#ifndef FLOWGATE_CONTROL_PRIORITY_QUEUE_HPP
#define FLOWGATE_CONTROL_PRIORITY_QUEUE_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <memory_resource>
#include <stdexcept>
#include <vector>

#include "../allocator.hpp"
#include "../coro_task.hpp"
#include "../errors.hpp"
#include "../primitives/crtp_base.hpp"
#include "../primitives/wait_queue.hpp"

namespace flowgate {

enum class queue_full_policy {
  drop_lowest_priority,
  drop_new,
  error,
  wait_for_space
};

template <typename T> struct priority_queue_observer {
  virtual ~priority_queue_observer() = default;

  // The item was refused, or evicted from the tail by a higher priority one
  virtual void on_item_dropped(const T &item) { (void)item; }

  // The item aged past the starvation threshold, was boosted, and is now
  // being dispatched
  virtual void on_starvation_prevention(const T &item) { (void)item; }
};

template <typename T> struct priority_queue_options {
  std::function<double(const T &)> priority_fn;
  std::size_t max_queue_size = 1000;
  std::size_t max_concurrent = 1;
  bool starvation_prevention = true;
  std::chrono::milliseconds starvation_threshold{5000};
  std::chrono::milliseconds boost_interval{1000};
  queue_full_policy on_queue_full = queue_full_policy::error;
  std::shared_ptr<priority_queue_observer<T>> observer;
};

// =============================================================================
// Priority Queue Executor
// =============================================================================
//
// Runs work in descending priority order with at most max_concurrent in
// flight. Equal priorities run in arrival order. Items that wait longer than
// starvation_threshold gain wait / boost_interval priority once.

template <typename T>
class priority_queue_executor
    : public primitive_base<priority_queue_executor<T>> {
  using clock = std::chrono::steady_clock;

  struct queued_item {
    waiter_node waiter;
    const T *payload{nullptr};
    double score{0.0};
    bool boosted{false};
    std::uint64_t sequence{0};
  };

  class enqueue_awaiter : public awaitable_base<enqueue_awaiter, void> {
  public:
    enqueue_awaiter(priority_queue_executor &executor, queued_item &item)
        : executor_(executor), item_(item) {}

    bool ready_impl() const { return false; }

    bool suspend_impl(std::coroutine_handle<> h) {
      const char *refusal = nullptr;
      bool report_drop = false;
      {
        std::lock_guard lock(executor_.mutex_);
        item_.waiter.arm(h);
        item_.sequence = executor_.next_sequence_++;

        if (executor_.queue_.size() < executor_.options_.max_queue_size) {
          executor_.insert_locked(&item_);
          executor_.dispatch_locked();
          return true;
        }

        switch (executor_.options_.on_queue_full) {
        case queue_full_policy::drop_lowest_priority: {
          queued_item *tail = executor_.queue_.back();
          if (item_.score > tail->score) {
            // The evicted item reports its own drop when it resumes
            executor_.queue_.pop_back();
            wake_waiter(&tail->waiter, wake_status::rejected,
                        std::make_exception_ptr(cancelled_exception(
                            "dropped due to lower priority")));
            executor_.insert_locked(&item_);
            executor_.dispatch_locked();
            return true;
          }
          refusal = "dropped due to lower priority";
          report_drop = true;
          break;
        }
        case queue_full_policy::drop_new:
          refusal = "queue full - new item dropped";
          report_drop = true;
          break;
        case queue_full_policy::error:
          refusal = "queue full";
          break;
        case queue_full_policy::wait_for_space:
          executor_.space_waiters_.push_back(&item_);
          return true;
        }
      }

      if (report_drop)
        executor_.options_.observer->on_item_dropped(*item_.payload);
      throw capacity_exceeded_exception(refusal);
    }

    void resume_impl() {
      if (item_.waiter.status == wake_status::granted) {
        if (item_.boosted)
          executor_.options_.observer->on_starvation_prevention(
              *item_.payload);
        return;
      }
      executor_.options_.observer->on_item_dropped(*item_.payload);
      std::rethrow_exception(item_.waiter.error);
    }

  private:
    priority_queue_executor &executor_;
    queued_item &item_;
  };

  // Releases the execution slot on every exit path
  class execution_slot {
  public:
    explicit execution_slot(priority_queue_executor &executor)
        : executor_(executor) {}
    execution_slot(const execution_slot &) = delete;
    execution_slot &operator=(const execution_slot &) = delete;
    ~execution_slot() { executor_.finish(); }

  private:
    priority_queue_executor &executor_;
  };

public:
  explicit priority_queue_executor(priority_queue_options<T> options)
      : options_(std::move(options)),
        queue_(waiter_allocator<queued_item *>()),
        space_waiters_(waiter_allocator<queued_item *>()) {
    if (!options_.priority_fn)
      throw invalid_configuration_exception(
          "priority queue requires a priority function");
    if (options_.max_queue_size == 0)
      throw invalid_configuration_exception(
          "priority queue max_queue_size must be greater than zero");
    if (options_.max_concurrent == 0)
      throw invalid_configuration_exception(
          "priority queue max_concurrent must be greater than zero");
    if (options_.boost_interval <= std::chrono::milliseconds::zero())
      throw invalid_configuration_exception(
          "priority queue boost_interval must be positive");
    if (!options_.observer)
      options_.observer = std::make_shared<priority_queue_observer<T>>();
  }

  // Queue fn under payload's priority; resolves with fn's result
  template <typename F>
  auto execute(T payload, F fn) -> coro_task<task_result_t<F &>> {
    queued_item item;
    item.payload = &payload;
    item.score = options_.priority_fn(payload);
    // NaN has no place in the ordering
    if (std::isnan(item.score))
      throw invalid_configuration_exception(
          "priority function returned NaN");
    co_await enqueue_awaiter(*this, item);
    execution_slot slot(*this);
    co_return co_await fn();
  }

  std::size_t queue_length() const {
    std::lock_guard lock(this->mutex_);
    return queue_.size();
  }

  // Items parked by wait_for_space, not yet in the queue
  std::size_t waiting_for_space() const {
    std::lock_guard lock(this->mutex_);
    return space_waiters_.size();
  }

  std::size_t active_count() const {
    std::lock_guard lock(this->mutex_);
    return active_;
  }

  const priority_queue_options<T> &options() const noexcept { return options_; }

private:
  static bool ranks_before(const queued_item *a, const queued_item *b) {
    if (a->score != b->score)
      return a->score > b->score;
    return a->sequence < b->sequence;
  }

  void insert_locked(queued_item *item) {
    auto it = std::upper_bound(queue_.begin(), queue_.end(), item,
                               &priority_queue_executor::ranks_before);
    queue_.insert(it, item);
  }

  void boost_starving_locked() {
    auto now = clock::now();
    bool any = false;
    for (queued_item *item : queue_) {
      auto waited = now - item->waiter.enqueued_at;
      if (item->boosted || waited <= options_.starvation_threshold)
        continue;
      item->score += std::chrono::duration<double>(waited) /
                     std::chrono::duration<double>(options_.boost_interval);
      item->boosted = true;
      any = true;
    }
    if (any)
      std::sort(queue_.begin(), queue_.end(),
                &priority_queue_executor::ranks_before);
  }

  void admit_space_waiters_locked() {
    while (queue_.size() < options_.max_queue_size && !space_waiters_.empty()) {
      queued_item *item = space_waiters_.front();
      space_waiters_.pop_front();
      insert_locked(item);
    }
  }

  void dispatch_locked() {
    while (active_ < options_.max_concurrent && !queue_.empty()) {
      if (options_.starvation_prevention)
        boost_starving_locked();
      queued_item *head = queue_.front();
      queue_.erase(queue_.begin());
      ++active_;
      wake_waiter(&head->waiter, wake_status::granted);
      admit_space_waiters_locked();
    }
  }

  void finish() {
    std::lock_guard lock(this->mutex_);
    if (active_ == 0)
      throw std::logic_error("priority queue finish without an active item");
    --active_;
    dispatch_locked();
  }

  priority_queue_options<T> options_;
  std::pmr::vector<queued_item *> queue_;
  std::pmr::deque<queued_item *> space_waiters_;
  std::size_t active_{0};
  std::uint64_t next_sequence_{0};
};

} // namespace flowgate

#endif // FLOWGATE_CONTROL_PRIORITY_QUEUE_HPP
