#ifndef FLOWGATE_SLEEP_HPP
#define FLOWGATE_SLEEP_HPP

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <memory>
#include <mutex>

#include "cancellation.hpp"
#include "primitives/crtp_base.hpp"
#include "task_scheduler.hpp"
#include "timer_service.hpp"
#include "wake_gate.hpp"

namespace flowgate {

enum class sleep_status { completed, cancelled };

class sleep_awaiter : public awaitable_base<sleep_awaiter, sleep_status> {
public:
  sleep_awaiter(std::chrono::steady_clock::time_point deadline,
                cancellation_token token = {})
      : deadline_(deadline), token_(std::move(token)) {}

  bool ready_impl() const {
    if (token_.is_cancelled())
      return true;
    return std::chrono::steady_clock::now() >= deadline_;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    // Held until both registrations are recorded; resume_impl waits on it
    std::lock_guard<std::mutex> lock(registration_mutex_);
    gate_ = wake_gate::make();
    timer_ = get_timer_service().add_timer(deadline_, h, gate_);

    // Race with timer expiry; exactly one wins via the gate. The callback
    // holds its own gate reference, never the frame.
    if (auto state = token_.state()) {
      callback_id_ = state->register_callback([gate = gate_, h]() {
        if (gate.try_claim())
          schedule_coro_handle(h);
      });
    }
    return true;
  }

  sleep_status resume_impl() {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (auto state = token_.state())
      state->unregister_callback(callback_id_);
    get_timer_service().cancel_timer(timer_);

    if (token_.is_cancelled())
      return sleep_status::cancelled;
    return sleep_status::completed;
  }

private:
  std::chrono::steady_clock::time_point deadline_;
  cancellation_token token_;
  wake_gate gate_;
  timer_id timer_{0};
  cancellation_state::callback_id callback_id_{0};
  std::mutex registration_mutex_;
};

// Sleep for a duration, optionally cancellable
template <typename Rep, typename Period>
sleep_awaiter sleep(std::chrono::duration<Rep, Period> duration,
                    cancellation_token token = {}) {
  return sleep_awaiter(
      std::chrono::steady_clock::now() +
          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
              duration),
      std::move(token));
}

// Sleep until a time point, optionally cancellable
inline sleep_awaiter sleep_until(std::chrono::steady_clock::time_point deadline,
                                 cancellation_token token = {}) {
  return sleep_awaiter(deadline, std::move(token));
}

} // namespace flowgate

#endif // FLOWGATE_SLEEP_HPP
