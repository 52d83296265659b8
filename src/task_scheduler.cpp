#include <algorithm>

#include "flowgate/allocator.hpp"
#include "flowgate/async_runtime.hpp"
#include "flowgate/task_scheduler.hpp"
#include "flowgate/timer_service.hpp"

namespace flowgate {

void init_coro_workers(task_scheduler &scheduler, std::size_t num_workers);
void shutdown_coro_workers(task_scheduler &scheduler);

task_scheduler g_global_task_scheduler{runtime_config::from_environment()};
async_runtime g_runtime;

task_scheduler::task_scheduler(runtime_config config) {
  init_allocator();
  init_timer_service();
  init_coro_workers(*this, std::max<std::size_t>(1, config.worker_threads));
}

task_scheduler::~task_scheduler() {
  // Timers fire their pending handles on shutdown, so stop them while the
  // workers can still run what they schedule.
  shutdown_timer_service();
  shutdown_coro_workers(*this);
}

} // namespace flowgate
