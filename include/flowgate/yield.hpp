#ifndef FLOWGATE_YIELD_HPP
#define FLOWGATE_YIELD_HPP

#include <coroutine>

namespace flowgate {

// Forward declaration
void schedule_coro_handle(std::coroutine_handle<> handle);

// Awaitable that yields execution back to the scheduler
struct yield_awaiter {
  bool await_ready() noexcept { return false; }

  void await_suspend(std::coroutine_handle<> h) { schedule_coro_handle(h); }

  void await_resume() noexcept {}
};

inline yield_awaiter yield() { return {}; }

} // namespace flowgate

#endif
