#ifndef FLOWGATE_FLOWGATE_HPP
#define FLOWGATE_FLOWGATE_HPP

// Runtime
#include "async_runtime.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "coro_task.hpp"
#include "errors.hpp"
#include "sleep.hpp"
#include "task_scheduler.hpp"
#include "timer_service.hpp"
#include "yield.hpp"

// Synchronization primitives
#include "primitives/barrier.hpp"
#include "primitives/countdown_latch.hpp"
#include "primitives/monitor.hpp"
#include "primitives/mutex.hpp"
#include "primitives/rw_lock.hpp"
#include "primitives/semaphore.hpp"

// Controllers
#include "control/backpressure.hpp"
#include "control/bulkhead.hpp"
#include "control/function_queue.hpp"
#include "control/priority_queue.hpp"
#include "control/rate_limiter.hpp"

#include "wrap.hpp"

#endif // FLOWGATE_FLOWGATE_HPP
