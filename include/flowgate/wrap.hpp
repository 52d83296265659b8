#ifndef FLOWGATE_WRAP_HPP
#define FLOWGATE_WRAP_HPP

#include <functional>
#include <optional>
#include <utility>

#include "control/priority_queue.hpp"
#include "coro_task.hpp"
#include "primitives/rw_lock.hpp"

namespace flowgate {

// =============================================================================
// Arity Wrappers
// =============================================================================
//
// Turn a callable of any arity into one whose every invocation runs through a
// controller's execute(). Arguments are taken by value and moved into the
// deferred call, so they outlive any suspension inside the controller.

namespace detail {

template <typename T> const T &unwrap_target(const T &target) { return target; }

template <typename T> T &unwrap_target(std::reference_wrapper<T> target) {
  return target.get();
}

} // namespace detail

template <typename Target, typename F> class wrapped_call {
public:
  wrapped_call(Target target, F fn)
      : target_(std::move(target)), fn_(std::move(fn)) {}

  template <typename... Args> auto operator()(Args... args) const {
    return detail::unwrap_target(target_).execute(
        [fn = fn_, ... args = std::move(args)]() mutable {
          return fn(std::move(args)...);
        });
  }

private:
  Target target_;
  F fn_;
};

template <typename Controller, typename F>
wrapped_call<std::reference_wrapper<Controller>, F> wrap(Controller &controller,
                                                         F fn) {
  return {std::ref(controller), std::move(fn)};
}

template <typename F>
wrapped_call<rw_read_side, F> wrap_read(async_rw_lock &lock, F fn,
                                        timeout_type timeout = std::nullopt) {
  return {rw_read_side{lock, timeout}, std::move(fn)};
}

template <typename F>
wrapped_call<rw_write_side, F> wrap_write(async_rw_lock &lock, F fn,
                                          timeout_type timeout = std::nullopt) {
  return {rw_write_side{lock, timeout}, std::move(fn)};
}

// Payload for a priority_queue_executor<T> is built from the call's
// arguments: T(args...), e.g. std::tuple<A, B> for a two-argument function.
template <typename T, typename F> class wrapped_priority_call {
public:
  wrapped_priority_call(priority_queue_executor<T> &executor, F fn)
      : executor_(&executor), fn_(std::move(fn)) {}

  template <typename... Args> auto operator()(Args... args) const {
    T payload(args...);
    return executor_->execute(std::move(payload),
                              [fn = fn_, ... args = std::move(args)]() mutable {
                                return fn(std::move(args)...);
                              });
  }

private:
  priority_queue_executor<T> *executor_;
  F fn_;
};

template <typename T, typename F>
wrapped_priority_call<T, F> wrap_priority(priority_queue_executor<T> &executor,
                                          F fn) {
  return {executor, std::move(fn)};
}

} // namespace flowgate

#endif // FLOWGATE_WRAP_HPP
