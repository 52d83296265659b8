#include "flowgate/primitives/rw_lock.hpp"
#include "flowgate/errors.hpp"

#include <stdexcept>

namespace flowgate {

bool rw_acquire_awaiter::suspend_impl(std::coroutine_handle<> h) {
  std::lock_guard lock(lock_.mutex_);
  if (access_ == rw_access::read) {
    if (lock_.can_read_locked()) {
      ++lock_.readers_;
      return false;
    }
  } else if (lock_.can_write_locked()) {
    lock_.writing_ = true;
    return false;
  }

  node_.arm(h);
  if (access_ == rw_access::read)
    lock_.read_queue_.push(&node_);
  else
    lock_.write_queue_.push(&node_);
  node_.arm_deadline(deadline_);
  return true;
}

void rw_acquire_awaiter::resume_impl() {
  std::lock_guard lock(lock_.mutex_);
  node_.disarm_deadline();
  if (node_.status == wake_status::granted)
    return;

  if (access_ == rw_access::read)
    lock_.read_queue_.remove(&node_);
  else
    lock_.write_queue_.remove(&node_);
  // A departing writer may have been holding back readers
  lock_.process_queues_locked();
  throw timeout_exception(access_ == rw_access::read
                              ? "read lock acquire timed out"
                              : "write lock acquire timed out");
}

void rw_guard::unlock() {
  if (!lock_)
    return;
  async_rw_lock *lock = std::exchange(lock_, nullptr);
  if (access_ == rw_access::read)
    lock->release_read();
  else
    lock->release_write();
}

void async_rw_lock::release_read() {
  std::lock_guard lock(mutex_);
  if (readers_ == 0)
    throw std::logic_error("release_read without an active reader");
  --readers_;
  process_queues_locked();
}

void async_rw_lock::release_write() {
  std::lock_guard lock(mutex_);
  if (!writing_)
    throw std::logic_error("release_write without an active writer");
  writing_ = false;
  process_queues_locked();
}

void async_rw_lock::process_queues_locked() {
  if (!write_queue_.empty() && readers_ == 0 && !writing_) {
    if (write_queue_.wake_next(wake_status::granted)) {
      writing_ = true;
      return;
    }
  }

  if (!read_queue_.empty() && !writing_ &&
      (!writer_priority_ || write_queue_.empty())) {
    readers_ += read_queue_.wake_all(wake_status::granted);
  }
}

coro_task<read_guard> async_rw_lock::scoped_read(timeout_type timeout) {
  co_await acquire_read(timeout);
  co_return read_guard(*this, rw_access::read);
}

coro_task<write_guard> async_rw_lock::scoped_write(timeout_type timeout) {
  co_await acquire_write(timeout);
  co_return write_guard(*this, rw_access::write);
}

std::size_t async_rw_lock::reader_count() const {
  std::lock_guard lock(mutex_);
  return readers_;
}

bool async_rw_lock::is_writing() const {
  std::lock_guard lock(mutex_);
  return writing_;
}

std::size_t async_rw_lock::queued_readers() const {
  std::lock_guard lock(mutex_);
  return read_queue_.size();
}

std::size_t async_rw_lock::queued_writers() const {
  std::lock_guard lock(mutex_);
  return write_queue_.size();
}

} // namespace flowgate
