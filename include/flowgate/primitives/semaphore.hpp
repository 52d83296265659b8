#ifndef FLOWGATE_PRIMITIVES_SEMAPHORE_HPP
#define FLOWGATE_PRIMITIVES_SEMAPHORE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include "../coro_task.hpp"
#include "crtp_base.hpp"
#include "wait_queue.hpp"

namespace flowgate {

// =============================================================================
// Semaphore Observer
// =============================================================================

struct semaphore_observer {
  virtual ~semaphore_observer() = default;

  // A caller found no permit and is about to queue at `position` (1-based)
  virtual void on_waiting(std::size_t position) { (void)position; }
};

class async_semaphore;

// =============================================================================
// Acquire Awaiter
// =============================================================================
//
// await_ready takes a free permit or reports the wait to the observer with
// the lock released. await_suspend re-checks and registers under the lock.

class semaphore_acquire_awaiter
    : public awaitable_base<semaphore_acquire_awaiter, void> {
public:
  semaphore_acquire_awaiter(async_semaphore &sem, deadline_type deadline,
                            std::int64_t priority)
      : sem_(sem), deadline_(deadline), priority_(priority) {}

  bool ready_impl();
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  async_semaphore &sem_;
  deadline_type deadline_;
  std::int64_t priority_;
  waiter_node node_;
};

// =============================================================================
// Semaphore Permit - Move-only RAII guard for one permit
// =============================================================================

class semaphore_permit {
public:
  semaphore_permit() = default;

  // Adopts a permit the caller already holds
  explicit semaphore_permit(async_semaphore &sem) noexcept : sem_(&sem) {}

  semaphore_permit(const semaphore_permit &) = delete;
  semaphore_permit &operator=(const semaphore_permit &) = delete;

  semaphore_permit(semaphore_permit &&other) noexcept
      : sem_(std::exchange(other.sem_, nullptr)) {}

  semaphore_permit &operator=(semaphore_permit &&other) noexcept {
    if (this != &other) {
      reset();
      sem_ = std::exchange(other.sem_, nullptr);
    }
    return *this;
  }

  ~semaphore_permit() { reset(); }

  void reset();

  bool owns_permit() const noexcept { return sem_ != nullptr; }
  explicit operator bool() const noexcept { return owns_permit(); }

private:
  async_semaphore *sem_{nullptr};
};

// =============================================================================
// Async Semaphore - Counting semaphore with ordered, timed waits
// =============================================================================

class async_semaphore : public primitive_base<async_semaphore> {
  friend class semaphore_acquire_awaiter;

public:
  explicit async_semaphore(std::size_t capacity,
                           queue_mode mode = queue_mode::fifo,
                           std::shared_ptr<semaphore_observer> observer = nullptr);

  // Take a permit, waiting up to `timeout`. Higher `priority` is served first
  // in priority mode.
  [[nodiscard]] semaphore_acquire_awaiter
  acquire(timeout_type timeout = std::nullopt, std::int64_t priority = 0) {
    return semaphore_acquire_awaiter(*this, deadline_after(timeout), priority);
  }

  bool try_acquire();

  // Hand the permit to the next waiter, or return it to the pool
  void release();

  coro_task<semaphore_permit> scoped_acquire(timeout_type timeout = std::nullopt,
                                             std::int64_t priority = 0);

  template <typename F>
  auto execute(F fn, timeout_type timeout = std::nullopt)
      -> coro_task<task_result_t<F &>> {
    co_await acquire(timeout);
    semaphore_permit permit(*this);
    co_return co_await fn();
  }

  std::size_t available_permits() const;
  std::size_t queue_length() const;
  std::size_t capacity() const noexcept { return capacity_; }
  queue_mode mode() const noexcept { return waiters_.mode(); }

private:
  bool take_locked() {
    if (held_ < capacity_) {
      ++held_;
      return true;
    }
    return false;
  }

  std::size_t capacity_;
  std::size_t held_{0};
  wait_queue waiters_;
  std::shared_ptr<semaphore_observer> observer_;
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_SEMAPHORE_HPP
