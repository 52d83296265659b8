#ifndef FLOWGATE_CORO_TASK_HPP
#define FLOWGATE_CORO_TASK_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace flowgate {

// Forward declaration for scheduler integration
void schedule_coro_handle(std::coroutine_handle<> handle);

// =============================================================================
// Continuation Slot
// =============================================================================
//
// One-shot race between the finishing coroutine and the awaiter installing a
// continuation. Encoded in a single word:
//
//   bit 0     : producer finished
//   bits 1..N : continuation address (coroutine frames are at least 2-aligned)
//
// Whichever side arrives second owns the resumption.

class continuation_slot {
public:
  static constexpr std::uintptr_t done_bit = 1;
  static constexpr std::uintptr_t addr_mask = ~std::uintptr_t(1);

  continuation_slot() = default;
  continuation_slot(const continuation_slot &) = delete;
  continuation_slot &operator=(const continuation_slot &) = delete;

  // Producer side. True if a continuation was already installed and the
  // caller must resume it.
  bool mark_done() noexcept {
    std::uintptr_t old = word_.fetch_or(done_bit, std::memory_order_acq_rel);
    return (old & addr_mask) != 0;
  }

  // Consumer side. True if the producer already finished and the consumer
  // must not suspend.
  bool install(std::coroutine_handle<> h) noexcept {
    auto addr = reinterpret_cast<std::uintptr_t>(h.address());
    std::uintptr_t old = word_.fetch_or(addr, std::memory_order_acq_rel);
    return (old & done_bit) != 0;
  }

  std::coroutine_handle<> continuation() const noexcept {
    std::uintptr_t val = word_.load(std::memory_order_acquire);
    return std::coroutine_handle<>::from_address(
        reinterpret_cast<void *>(val & addr_mask));
  }

private:
  std::atomic<std::uintptr_t> word_{0};
};

// =============================================================================
// Shared State
// =============================================================================

template <typename T> struct coro_shared_state {
  std::variant<std::monostate, T, std::exception_ptr> result;
  std::atomic<bool> ready{false};
  continuation_slot slot;
  std::mutex mutex;
  std::condition_variable cv;

  void set_value(T value) { result.template emplace<1>(std::move(value)); }

  void set_exception(std::exception_ptr e) { result.template emplace<2>(e); }

  // Called from final_suspend, once the frame is suspended
  void mark_ready() {
    {
      std::lock_guard lock(mutex);
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return ready.load(std::memory_order_acquire); });
  }

  T take() {
    if (result.index() == 2)
      std::rethrow_exception(std::get<2>(result));
    return std::get<1>(std::move(result));
  }

  bool is_ready() const { return ready.load(std::memory_order_acquire); }
};

template <> struct coro_shared_state<void> {
  std::exception_ptr exception;
  std::atomic<bool> ready{false};
  continuation_slot slot;
  std::mutex mutex;
  std::condition_variable cv;

  void set_value() {}

  void set_exception(std::exception_ptr e) { exception = e; }

  void mark_ready() {
    {
      std::lock_guard lock(mutex);
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return ready.load(std::memory_order_acquire); });
  }

  void take() {
    if (exception)
      std::rethrow_exception(exception);
  }

  bool is_ready() const { return ready.load(std::memory_order_acquire); }
};

// =============================================================================
// Promise
// =============================================================================

template <typename T> class coro_task;

namespace detail {

template <typename T> struct promise_base {
  std::shared_ptr<coro_shared_state<T>> state =
      std::make_shared<coro_shared_state<T>>();

  std::suspend_always initial_suspend() noexcept { return {}; }

  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      // Keep the state alive: once ready is published the frame may be
      // destroyed by the owning task.
      auto state = h.promise().state;
      bool resume_continuation = state->slot.mark_done();
      std::coroutine_handle<> next =
          resume_continuation ? state->slot.continuation()
                              : std::noop_coroutine();
      state->mark_ready();
      return next;
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() { state->set_exception(std::current_exception()); }
};

template <typename T> struct promise : promise_base<T> {
  coro_task<T> get_return_object();

  template <typename U>
    requires std::is_convertible_v<U &&, T>
  void return_value(U &&value) {
    this->state->set_value(T(std::forward<U>(value)));
  }
};

template <> struct promise<void> : promise_base<void> {
  coro_task<void> get_return_object();

  void return_void() { state->set_value(); }
};

} // namespace detail

// =============================================================================
// coro_task<T> - lazily started, awaitable, blocking-gettable
// =============================================================================

template <typename T = void> class [[nodiscard]] coro_task {
public:
  using promise_type = detail::promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;
  using value_type = T;

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load()) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      release();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load());
    }
    return *this;
  }

  ~coro_task() { release(); }

  // Awaitable interface
  bool await_ready() const noexcept { return state_ && state_->is_ready(); }

  bool await_suspend(std::coroutine_handle<> awaiting) {
    // Start first: if the task finishes inline, install() reports it and the
    // awaiting coroutine continues without suspending.
    start();
    return !state_->slot.install(awaiting);
  }

  T await_resume() { return state_->take(); }

  // Blocking get for non-coroutine contexts
  T get() {
    start();
    state_->wait();
    return state_->take();
  }

  bool is_ready() const { return state_ && state_->is_ready(); }

  // Schedule on the worker pool (no-op after the first call)
  void start() {
    bool expected = false;
    if (handle_ && started_.compare_exchange_strong(expected, true))
      schedule_coro_handle(handle_);
  }

  bool is_started() const { return started_.load(); }

private:
  friend struct detail::promise<T>;

  explicit coro_task(handle_type h)
      : handle_(h), state_(h.promise().state), started_(false) {}

  void release() {
    if (!handle_)
      return;
    if (started_.load() && !state_->is_ready())
      state_->wait();
    handle_.destroy();
    handle_ = nullptr;
  }

  handle_type handle_;
  std::shared_ptr<coro_shared_state<T>> state_;
  std::atomic<bool> started_;
};

namespace detail {

template <typename T> coro_task<T> promise<T>::get_return_object() {
  return coro_task<T>{coro_task<T>::handle_type::from_promise(*this)};
}

inline coro_task<void> promise<void>::get_return_object() {
  return coro_task<void>{coro_task<void>::handle_type::from_promise(*this)};
}

} // namespace detail

// Type trait for detecting coro_task
template <typename T> struct is_coro_task : std::false_type {};

template <typename T> struct is_coro_task<coro_task<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_coro_task_v = is_coro_task<T>::value;

// Result type of a callable producing a coro_task
template <typename F, typename... Args>
using task_result_t =
    typename std::invoke_result_t<F, Args...>::value_type;

} // namespace flowgate

#endif
