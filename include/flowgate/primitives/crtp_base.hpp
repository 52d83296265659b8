#ifndef FLOWGATE_PRIMITIVES_CRTP_BASE_HPP
#define FLOWGATE_PRIMITIVES_CRTP_BASE_HPP

#include <chrono>
#include <coroutine>
#include <mutex>
#include <optional>

#include "wait_queue.hpp"

namespace flowgate {

// =============================================================================
// Primitive Base - Provides the state mutex shared with awaiters
// =============================================================================

template <typename Derived> class primitive_base {
protected:
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;

  mutable mutex_type mutex_;

  // CRTP access to derived class
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  primitive_base() = default;
  ~primitive_base() = default;

  primitive_base(const primitive_base &) = delete;
  primitive_base &operator=(const primitive_base &) = delete;
  primitive_base(primitive_base &&) = delete;
  primitive_base &operator=(primitive_base &&) = delete;
};

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl()
  // - bool suspend_impl(std::coroutine_handle<> h)  (false = don't suspend)
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  void await_resume() { derived().resume_impl(); }
};

} // namespace flowgate

#endif // FLOWGATE_PRIMITIVES_CRTP_BASE_HPP
