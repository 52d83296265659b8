#ifndef FLOWGATE_PRIMITIVES_MUTEX_HPP
#define FLOWGATE_PRIMITIVES_MUTEX_HPP

#include <memory>
#include <mutex>
#include <utility>

#include "../errors.hpp"
#include "semaphore.hpp"

namespace flowgate {

struct mutex_observer {
  virtual ~mutex_observer() = default;

  // A caller found the mutex held and is about to wait
  virtual void on_blocked() {}
};

struct mutex_options {
  // Bound applied by synchronized(); std::nullopt waits forever
  timeout_type timeout;
  // When false, a timed-out synchronized() runs fn WITHOUT the lock
  bool throw_on_timeout = true;
  std::shared_ptr<mutex_observer> observer;
};

class async_mutex;

// =============================================================================
// Mutex Guard - Move-only ownership of an async_mutex
// =============================================================================

class mutex_guard {
public:
  mutex_guard() = default;
  mutex_guard(async_mutex &mutex, std::adopt_lock_t) noexcept
      : mutex_(&mutex) {}

  mutex_guard(const mutex_guard &) = delete;
  mutex_guard &operator=(const mutex_guard &) = delete;

  mutex_guard(mutex_guard &&other) noexcept
      : mutex_(std::exchange(other.mutex_, nullptr)) {}

  mutex_guard &operator=(mutex_guard &&other) noexcept {
    if (this != &other) {
      unlock();
      mutex_ = std::exchange(other.mutex_, nullptr);
    }
    return *this;
  }

  ~mutex_guard() { unlock(); }

  void unlock();

  bool owns_lock() const noexcept { return mutex_ != nullptr; }

private:
  async_mutex *mutex_{nullptr};
};

// =============================================================================
// Async Mutex - Single-permit semaphore with an owned view
// =============================================================================

class async_mutex {
public:
  explicit async_mutex(mutex_options options = {});

  async_mutex(const async_mutex &) = delete;
  async_mutex &operator=(const async_mutex &) = delete;

  [[nodiscard]] semaphore_acquire_awaiter
  acquire(timeout_type timeout = std::nullopt) {
    return permit_.acquire(timeout);
  }

  bool try_acquire() { return permit_.try_acquire(); }
  void release() { permit_.release(); }

  coro_task<mutex_guard> scoped_lock(timeout_type timeout = std::nullopt);

  // Run fn under the lock, bounded by the configured timeout
  template <typename F>
  auto synchronized(F fn) -> coro_task<task_result_t<F &>> {
    bool locked = true;
    try {
      co_await acquire(options_.timeout);
    } catch (const timeout_exception &) {
      if (options_.throw_on_timeout)
        throw;
      locked = false;
    }
    if (!locked)
      co_return co_await fn();

    mutex_guard guard(*this, std::adopt_lock);
    co_return co_await fn();
  }

  template <typename F> auto execute(F fn) -> coro_task<task_result_t<F &>> {
    return synchronized(std::move(fn));
  }

  bool is_locked() const { return permit_.available_permits() == 0; }
  std::size_t queue_length() const { return permit_.queue_length(); }
  const mutex_options &options() const noexcept { return options_; }

private:
  mutex_options options_;
  async_semaphore permit_;
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_MUTEX_HPP
