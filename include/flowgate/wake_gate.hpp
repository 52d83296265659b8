#ifndef FLOWGATE_WAKE_GATE_HPP
#define FLOWGATE_WAKE_GATE_HPP

#include <atomic>
#include <memory>

#include "allocator.hpp"

namespace flowgate {

// =============================================================================
// Wake Gate
// =============================================================================
//
// One-shot claim shared by every party that may resume a suspended waiter:
// the primitive releasing it, the timer_service enforcing its deadline, and a
// cancellation callback. Only the party that flips the gate resumes the
// coroutine. The gate is reference counted so a losing party can still test it
// after the waiter's frame is gone.

class wake_gate {
public:
  wake_gate() = default;

  static wake_gate make() {
    wake_gate gate;
    gate.flag_ = std::allocate_shared<std::atomic<bool>>(
        waiter_allocator<std::atomic<bool>>(), false);
    return gate;
  }

  // True if this caller won the right to resume the waiter
  bool try_claim() const noexcept {
    if (!flag_)
      return false;
    bool expected = false;
    return flag_->compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel);
  }

  bool is_claimed() const noexcept {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

  explicit operator bool() const noexcept { return flag_ != nullptr; }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace flowgate

#endif // FLOWGATE_WAKE_GATE_HPP
