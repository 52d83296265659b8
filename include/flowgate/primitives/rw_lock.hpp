#ifndef FLOWGATE_PRIMITIVES_RW_LOCK_HPP
#define FLOWGATE_PRIMITIVES_RW_LOCK_HPP

#include <cstddef>
#include <utility>

#include "../coro_task.hpp"
#include "crtp_base.hpp"
#include "wait_queue.hpp"

namespace flowgate {

class async_rw_lock;

enum class rw_access { read, write };

class rw_acquire_awaiter : public awaitable_base<rw_acquire_awaiter, void> {
public:
  rw_acquire_awaiter(async_rw_lock &lock, rw_access access,
                     deadline_type deadline)
      : lock_(lock), access_(access), deadline_(deadline) {}

  bool ready_impl() const { return false; }
  bool suspend_impl(std::coroutine_handle<> h);
  void resume_impl();

private:
  async_rw_lock &lock_;
  rw_access access_;
  deadline_type deadline_;
  waiter_node node_;
};

// Move-only guard releasing one read or write hold
class rw_guard {
public:
  rw_guard() = default;
  rw_guard(async_rw_lock &lock, rw_access access) noexcept
      : lock_(&lock), access_(access) {}

  rw_guard(const rw_guard &) = delete;
  rw_guard &operator=(const rw_guard &) = delete;

  rw_guard(rw_guard &&other) noexcept
      : lock_(std::exchange(other.lock_, nullptr)), access_(other.access_) {}

  rw_guard &operator=(rw_guard &&other) noexcept {
    if (this != &other) {
      unlock();
      lock_ = std::exchange(other.lock_, nullptr);
      access_ = other.access_;
    }
    return *this;
  }

  ~rw_guard() { unlock(); }

  void unlock();
  bool owns_lock() const noexcept { return lock_ != nullptr; }

private:
  async_rw_lock *lock_{nullptr};
  rw_access access_{rw_access::read};
};

using read_guard = rw_guard;
using write_guard = rw_guard;

// =============================================================================
// Async Reader-Writer Lock
// =============================================================================
//
// Many readers or one writer. With writer_priority, a queued writer blocks
// new readers.

class async_rw_lock : public primitive_base<async_rw_lock> {
  friend class rw_acquire_awaiter;

public:
  explicit async_rw_lock(bool writer_priority = false)
      : writer_priority_(writer_priority), read_queue_(queue_mode::fifo),
        write_queue_(queue_mode::fifo) {}

  [[nodiscard]] rw_acquire_awaiter
  acquire_read(timeout_type timeout = std::nullopt) {
    return rw_acquire_awaiter(*this, rw_access::read, deadline_after(timeout));
  }

  [[nodiscard]] rw_acquire_awaiter
  acquire_write(timeout_type timeout = std::nullopt) {
    return rw_acquire_awaiter(*this, rw_access::write, deadline_after(timeout));
  }

  void release_read();
  void release_write();

  coro_task<read_guard> scoped_read(timeout_type timeout = std::nullopt);
  coro_task<write_guard> scoped_write(timeout_type timeout = std::nullopt);

  template <typename F>
  auto read_lock(F fn, timeout_type timeout = std::nullopt)
      -> coro_task<task_result_t<F &>> {
    co_await acquire_read(timeout);
    read_guard guard(*this, rw_access::read);
    co_return co_await fn();
  }

  template <typename F>
  auto write_lock(F fn, timeout_type timeout = std::nullopt)
      -> coro_task<task_result_t<F &>> {
    co_await acquire_write(timeout);
    write_guard guard(*this, rw_access::write);
    co_return co_await fn();
  }

  std::size_t reader_count() const;
  bool is_writing() const;
  std::size_t queued_readers() const;
  std::size_t queued_writers() const;
  bool writer_priority() const noexcept { return writer_priority_; }

private:
  bool can_read_locked() const {
    return !writing_ && !(writer_priority_ && !write_queue_.empty());
  }
  bool can_write_locked() const { return readers_ == 0 && !writing_; }

  // Grant one writer, or a batch of readers, as the state allows
  void process_queues_locked();

  bool writer_priority_;
  std::size_t readers_{0};
  bool writing_{false};
  wait_queue read_queue_;
  wait_queue write_queue_;
};

// Adapters exposing one side of the lock through execute(), for wrap()
struct rw_read_side {
  async_rw_lock &lock;
  timeout_type timeout;

  template <typename F>
  auto execute(F fn) const -> coro_task<task_result_t<F &>> {
    return lock.read_lock(std::move(fn), timeout);
  }
};

struct rw_write_side {
  async_rw_lock &lock;
  timeout_type timeout;

  template <typename F>
  auto execute(F fn) const -> coro_task<task_result_t<F &>> {
    return lock.write_lock(std::move(fn), timeout);
  }
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_RW_LOCK_HPP
