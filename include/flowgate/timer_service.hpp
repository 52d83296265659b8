#ifndef FLOWGATE_TIMER_SERVICE_HPP
#define FLOWGATE_TIMER_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "wake_gate.hpp"

namespace flowgate {

using timer_id = std::uint64_t;

struct timer_entry {
  std::chrono::steady_clock::time_point deadline;
  std::coroutine_handle<> handle;
  wake_gate gate;
  timer_id id;

  // Min-heap: earliest deadline has highest priority
  bool operator>(const timer_entry &other) const {
    return deadline > other.deadline;
  }
};

// Deadline thread shared by every timed wait. A firing timer resumes its
// handle only if it wins the entry's wake gate.
class timer_service {
public:
  timer_service();
  ~timer_service();

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  timer_id add_timer(std::chrono::steady_clock::time_point deadline,
                     std::coroutine_handle<> handle, wake_gate gate);

  // Drop a timer that is no longer needed. No-op if it already fired.
  void cancel_timer(timer_id id);

  std::size_t pending() const;

  void shutdown();

private:
  void run();

  std::vector<timer_entry> heap_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  timer_id next_id_{1};
  std::thread thread_;
};

timer_service &get_timer_service();

// Called from task_scheduler construction/destruction
void init_timer_service();
void shutdown_timer_service();

} // namespace flowgate

#endif // FLOWGATE_TIMER_SERVICE_HPP
