#ifndef FLOWGATE_ERRORS_HPP
#define FLOWGATE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace flowgate {

// =============================================================================
// Flow-control Exceptions
// =============================================================================
//
// Every failure a controller produces on its own behalf derives from
// flow_control_exception. Errors thrown by wrapped callables are never
// translated and reach the caller unchanged.

struct flow_control_exception : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Admission denied synchronously (full buffer, full queue, drop policy)
struct capacity_exceeded_exception : flow_control_exception {
  explicit capacity_exceeded_exception(const std::string &what)
      : flow_control_exception(what) {}
};

// A bounded wait expired; the waiter was already removed
struct timeout_exception : flow_control_exception {
  explicit timeout_exception(const std::string &what = "operation timed out")
      : flow_control_exception(what) {}
};

// Constructor-time validation failure
struct invalid_configuration_exception : flow_control_exception {
  explicit invalid_configuration_exception(const std::string &what)
      : flow_control_exception(what) {}
};

// Barrier used after it broke (timeout, failed action, or one-shot release)
struct broken_barrier_exception : flow_control_exception {
  explicit broken_barrier_exception(const std::string &what = "barrier is broken")
      : flow_control_exception(what) {}
};

// count_down() on a latch that already reached zero
struct latch_underflow_exception : flow_control_exception {
  explicit latch_underflow_exception(
      const std::string &what = "countdown latch already at zero")
      : flow_control_exception(what) {}
};

// Queued work evicted before it ran, or a wait cut short by cancellation
struct cancelled_exception : flow_control_exception {
  explicit cancelled_exception(const std::string &what = "operation cancelled")
      : flow_control_exception(what) {}
};

} // namespace flowgate

#endif // FLOWGATE_ERRORS_HPP
