#ifndef FLOWGATE_CONTROL_BULKHEAD_HPP
#define FLOWGATE_CONTROL_BULKHEAD_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <vector>

#include "../primitives/semaphore.hpp"

namespace flowgate {

struct bulkhead_observer {
  virtual ~bulkhead_observer() = default;

  // Any failure inside execute(), including acquire timeouts
  virtual void on_isolation_failure(std::exception_ptr error) { (void)error; }
};

struct bulkhead_options {
  std::size_t pool_size = 10;
  // Advisory; reported but not enforced
  std::size_t queue_size = 100;
  timeout_type timeout;
  std::shared_ptr<bulkhead_observer> observer;
};

// =============================================================================
// Bulkhead - Work partitioned across independent single-slot pools
// =============================================================================

class bulkhead {
public:
  explicit bulkhead(bulkhead_options options);

  bulkhead(const bulkhead &) = delete;
  bulkhead &operator=(const bulkhead &) = delete;

  // Runs fn in the next pool (round-robin). options.timeout applies unless
  // an explicit timeout is given.
  template <typename F>
  auto execute(F fn, timeout_type timeout = std::nullopt)
      -> coro_task<task_result_t<F &>> {
    async_semaphore &pool = next_pool();
    timeout_type bound = timeout ? timeout : options_.timeout;
    try {
      semaphore_permit permit = co_await pool.scoped_acquire(bound);
      co_return co_await fn();
    } catch (...) {
      options_.observer->on_isolation_failure(std::current_exception());
      throw;
    }
  }

  std::size_t pool_size() const noexcept { return pools_.size(); }
  std::size_t queue_size() const noexcept { return options_.queue_size; }
  std::size_t available_pools() const;
  std::size_t queued_in_pool(std::size_t index) const;

private:
  async_semaphore &next_pool();

  bulkhead_options options_;
  std::vector<std::unique_ptr<async_semaphore>> pools_;
  std::atomic<std::size_t> next_{0};
};

} // namespace flowgate

#endif // FLOWGATE_CONTROL_BULKHEAD_HPP
