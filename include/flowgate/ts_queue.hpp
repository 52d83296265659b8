#ifndef FLOWGATE_TS_QUEUE_HPP
#define FLOWGATE_TS_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <utility>

#include "allocator.hpp"

namespace flowgate {

// Thread-safe MPMC queue used for coroutine submissions.
// receive() blocks until an item arrives or the queue is closed and drained.
template <typename T> class ts_queue {
public:
  ts_queue() : items_(waiter_allocator<T>()) {}

  ts_queue(const ts_queue &) = delete;
  ts_queue &operator=(const ts_queue &) = delete;

  // Returns false once the queue is closed
  bool send(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty())
      return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::pmr::deque<T> items_;
  bool closed_{false};
};

} // namespace flowgate

#endif
