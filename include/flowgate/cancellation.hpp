#ifndef FLOWGATE_CANCELLATION_HPP
#define FLOWGATE_CANCELLATION_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace flowgate {

// One per cancellation_source. Controllers hook their sleepers in through
// register_callback; callbacks run on the cancelling thread, outside the lock.
class cancellation_state {
public:
  using callback_id = std::size_t;

  cancellation_state() = default;

  cancellation_state(const cancellation_state &) = delete;
  cancellation_state &operator=(const cancellation_state &) = delete;

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  void cancel() {
    std::vector<entry> fired;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_.exchange(true, std::memory_order_acq_rel))
        return;
      fired.swap(entries_);
    }
    for (auto &e : fired)
      e.fn();
  }

  // Returns 0 when the state was already cancelled; cb has then run inline.
  callback_id register_callback(std::function<void()> cb) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!cancelled_.load(std::memory_order_acquire)) {
        entries_.push_back(entry{next_id_, std::move(cb)});
        return next_id_++;
      }
    }
    cb();
    return 0;
  }

  void unregister_callback(callback_id id) {
    if (id == 0)
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const entry &e) { return e.id == id; });
    if (it != entries_.end())
      entries_.erase(it);
  }

private:
  struct entry {
    callback_id id;
    std::function<void()> fn;
  };

  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::vector<entry> entries_;
  callback_id next_id_{1};
};

// Lightweight copyable handle; shares the state with its source
class cancellation_token {
public:
  cancellation_token() = default;

  bool is_cancelled() const { return state_ && state_->is_cancelled(); }

  void throw_if_cancelled() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  explicit operator bool() const { return state_ != nullptr; }

  // Access to state for sleep and controller integration
  std::shared_ptr<cancellation_state> state() const { return state_; }

private:
  friend class cancellation_source;
  explicit cancellation_token(std::shared_ptr<cancellation_state> state)
      : state_(std::move(state)) {}

  std::shared_ptr<cancellation_state> state_;
};

// Owns the cancellation state, creates tokens, triggers cancellation
class cancellation_source {
public:
  cancellation_source() : state_(std::make_shared<cancellation_state>()) {}

  cancellation_token token() const { return cancellation_token{state_}; }

  void cancel() { state_->cancel(); }

  bool is_cancelled() const { return state_->is_cancelled(); }

private:
  std::shared_ptr<cancellation_state> state_;
};

} // namespace flowgate

#endif // FLOWGATE_CANCELLATION_HPP
