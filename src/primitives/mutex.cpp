#include "flowgate/primitives/mutex.hpp"

namespace flowgate {

namespace {

// Reports semaphore waits as blocked lock attempts
class blocked_reporter : public semaphore_observer {
public:
  explicit blocked_reporter(std::shared_ptr<mutex_observer> target)
      : target_(std::move(target)) {}

  void on_waiting(std::size_t) override { target_->on_blocked(); }

private:
  std::shared_ptr<mutex_observer> target_;
};

mutex_options with_default_observer(mutex_options options) {
  if (!options.observer)
    options.observer = std::make_shared<mutex_observer>();
  return options;
}

} // namespace

void mutex_guard::unlock() {
  if (mutex_)
    std::exchange(mutex_, nullptr)->release();
}

async_mutex::async_mutex(mutex_options options)
    : options_(with_default_observer(std::move(options))),
      permit_(1, queue_mode::fifo,
              std::make_shared<blocked_reporter>(options_.observer)) {}

coro_task<mutex_guard> async_mutex::scoped_lock(timeout_type timeout) {
  co_await acquire(timeout);
  co_return mutex_guard(*this, std::adopt_lock);
}

} // namespace flowgate
