#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "flowgate/async_runtime.hpp"
#include "flowgate/errors.hpp"
#include "flowgate/primitives/barrier.hpp"
#include "flowgate/primitives/countdown_latch.hpp"
#include "flowgate/primitives/monitor.hpp"
#include "flowgate/primitives/mutex.hpp"
#include "flowgate/primitives/rw_lock.hpp"
#include "flowgate/primitives/semaphore.hpp"
#include "flowgate/sleep.hpp"
#include "flowgate/task_scheduler.hpp"
#include "flowgate/yield.hpp"

using namespace flowgate;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// =============================================================================
// Helpers
// =============================================================================

// Poll from the main thread until pred holds or the deadline passes
template <typename Pred>
static bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

struct order_log {
  std::mutex mutex;
  std::vector<int> entries;

  void push(int v) {
    std::lock_guard lock(mutex);
    entries.push_back(v);
  }

  std::vector<int> snapshot() {
    std::lock_guard lock(mutex);
    return entries;
  }
};

// Tracks the peak number of simultaneous holders
struct occupancy {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  void enter() {
    int now = current.fetch_add(1) + 1;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
  }
  void leave() { current.fetch_sub(1); }
};

template <typename E, typename F> static bool throws_as(F &&fn) {
  try {
    fn();
  } catch (const E &) {
    return true;
  }
  return false;
}

coro_task<void> acquire_and_record(async_semaphore &sem, order_log &log, int id,
                                   std::int64_t priority = 0) {
  co_await sem.acquire(std::nullopt, priority);
  log.push(id);
  sem.release();
}

// =============================================================================
// Semaphore Tests
// =============================================================================

struct position_recorder : semaphore_observer {
  std::mutex mutex;
  std::vector<std::size_t> positions;

  void on_waiting(std::size_t position) override {
    std::lock_guard lock(mutex);
    positions.push_back(position);
  }
};

void test_semaphore() {
  TEST("semaphore rejects zero capacity") {
    assert(throws_as<invalid_configuration_exception>(
        [] { async_semaphore sem(0); }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore bounds concurrent holders") {
    async_semaphore sem(2);
    occupancy occ;
    auto work = [&]() -> coro_task<void> {
      occ.enter();
      co_await sleep(5ms);
      occ.leave();
    };
    auto runner = [&]() -> coro_task<void> {
      std::vector<coro_task<void>> tasks;
      for (int i = 0; i < 8; ++i)
        tasks.push_back(sem.execute(work));
      co_await when_all(std::move(tasks));
    };
    g_runtime.run(runner());
    assert(occ.peak.load() <= 2);
    assert(occ.peak.load() >= 1);
    assert(sem.available_permits() == 2);
    assert(sem.queue_length() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore fifo hands permits in arrival order") {
    async_semaphore sem(1, queue_mode::fifo);
    order_log log;
    assert(sem.try_acquire());

    std::vector<coro_task<void>> waiters;
    for (int i = 0; i < 3; ++i) {
      waiters.push_back(acquire_and_record(sem, log, i));
      waiters.back().start();
      assert(eventually([&] { return sem.queue_length() == std::size_t(i + 1); }));
    }
    sem.release();
    for (auto &w : waiters)
      w.get();

    assert((log.snapshot() == std::vector<int>{0, 1, 2}));
    assert(sem.available_permits() == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore lifo serves the newest waiter first") {
    async_semaphore sem(1, queue_mode::lifo);
    order_log log;
    assert(sem.try_acquire());

    std::vector<coro_task<void>> waiters;
    for (int i = 0; i < 3; ++i) {
      waiters.push_back(acquire_and_record(sem, log, i));
      waiters.back().start();
      assert(eventually([&] { return sem.queue_length() == std::size_t(i + 1); }));
    }
    sem.release();
    for (auto &w : waiters)
      w.get();

    assert((log.snapshot() == std::vector<int>{2, 1, 0}));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore priority mode orders by key then arrival") {
    async_semaphore sem(1, queue_mode::priority);
    order_log log;
    assert(sem.try_acquire());

    const std::int64_t keys[] = {1, 5, 3, 5};
    std::vector<coro_task<void>> waiters;
    for (int i = 0; i < 4; ++i) {
      waiters.push_back(acquire_and_record(sem, log, i, keys[i]));
      waiters.back().start();
      assert(eventually([&] { return sem.queue_length() == std::size_t(i + 1); }));
    }
    sem.release();
    for (auto &w : waiters)
      w.get();

    assert((log.snapshot() == std::vector<int>{1, 3, 2, 0}));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore observer sees 1-based positions") {
    auto observer = std::make_shared<position_recorder>();
    async_semaphore sem(1, queue_mode::fifo, observer);
    order_log log;
    assert(sem.try_acquire());

    auto first = acquire_and_record(sem, log, 0);
    first.start();
    assert(eventually([&] { return sem.queue_length() == 1; }));
    auto second = acquire_and_record(sem, log, 1);
    second.start();
    assert(eventually([&] { return sem.queue_length() == 2; }));

    sem.release();
    first.get();
    second.get();

    std::lock_guard lock(observer->mutex);
    assert((observer->positions == std::vector<std::size_t>{1, 2}));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore acquire times out and leaves the queue") {
    async_semaphore sem(1);
    assert(sem.try_acquire());

    auto start = std::chrono::steady_clock::now();
    bool timed_out = false;
    try {
      g_runtime.run([&]() -> coro_task<void> { co_await sem.acquire(20ms); }());
    } catch (const timeout_exception &) {
      timed_out = true;
    }
    assert(timed_out);
    assert(std::chrono::steady_clock::now() - start >= 20ms);
    assert(sem.queue_length() == 0);
    assert(sem.available_permits() == 0);

    sem.release();
    assert(sem.available_permits() == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore release without acquire is a logic error") {
    async_semaphore sem(1);
    assert(throws_as<std::logic_error>([&] { sem.release(); }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("semaphore_permit and execute release on every path") {
    async_semaphore sem(1);
    {
      auto permit = g_runtime.run(sem.scoped_acquire());
      assert(permit.owns_permit());
      assert(sem.available_permits() == 0);
    }
    assert(sem.available_permits() == 1);

    bool caught = false;
    try {
      g_runtime.run(sem.execute([]() -> coro_task<int> {
        throw std::runtime_error("inner failure");
        co_return 1;
      }));
    } catch (const std::runtime_error &e) {
      caught = std::string(e.what()) == "inner failure";
    }
    assert(caught);
    assert(sem.available_permits() == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Mutex Tests
// =============================================================================

struct blocked_counter : mutex_observer {
  std::atomic<int> blocked{0};
  void on_blocked() override { blocked.fetch_add(1); }
};

void test_mutex() {
  TEST("mutex serializes critical sections") {
    async_mutex mutex;
    occupancy occ;
    int shared = 0;
    auto critical = [&]() -> coro_task<void> {
      occ.enter();
      int seen = shared;
      co_await yield();
      shared = seen + 1;
      occ.leave();
    };
    auto runner = [&]() -> coro_task<void> {
      std::vector<coro_task<void>> tasks;
      for (int i = 0; i < 50; ++i)
        tasks.push_back(mutex.synchronized(critical));
      co_await when_all(std::move(tasks));
    };
    g_runtime.run(runner());
    assert(shared == 50);
    assert(occ.peak.load() == 1);
    assert(!mutex.is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("mutex reports blocked callers") {
    auto observer = std::make_shared<blocked_counter>();
    async_mutex mutex(mutex_options{std::nullopt, true, observer});
    assert(mutex.try_acquire());
    assert(mutex.is_locked());

    auto task = mutex.synchronized([]() -> coro_task<int> { co_return 7; });
    task.start();
    assert(eventually([&] { return mutex.queue_length() == 1; }));
    assert(observer->blocked.load() == 1);

    mutex.release();
    assert(task.get() == 7);
    assert(!mutex.is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("mutex synchronized times out") {
    async_mutex mutex(mutex_options{20ms, true, nullptr});
    assert(mutex.try_acquire());
    std::atomic<bool> ran{false};
    bool timed_out = false;
    try {
      g_runtime.run(mutex.synchronized([&]() -> coro_task<void> {
        ran = true;
        co_return;
      }));
    } catch (const timeout_exception &) {
      timed_out = true;
    }
    assert(timed_out);
    assert(!ran.load());
    assert(mutex.queue_length() == 0);
    mutex.release();
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("mutex without throw_on_timeout runs unlocked") {
    async_mutex mutex(mutex_options{20ms, false, nullptr});
    assert(mutex.try_acquire());
    int result = g_runtime.run(
        mutex.synchronized([]() -> coro_task<int> { co_return 3; }));
    assert(result == 3);
    // The escape hatch must not release a lock it never took
    assert(mutex.is_locked());
    mutex.release();
    assert(!mutex.is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("mutex_guard unlocks on scope exit") {
    async_mutex mutex;
    {
      auto guard = g_runtime.run(mutex.scoped_lock());
      assert(guard.owns_lock());
      assert(mutex.is_locked());
    }
    assert(!mutex.is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Monitor Tests
// =============================================================================

void test_monitor() {
  TEST("monitor wait_while wakes on notify") {
    async_monitor monitor;
    int items = 0;
    auto consumer = [&]() -> coro_task<bool> {
      co_return co_await monitor.synchronized([&]() -> coro_task<bool> {
        bool ok = co_await monitor.wait_while([&] { return items == 0; }, 2s);
        if (ok)
          --items;
        co_return ok;
      });
    };
    auto task = consumer();
    task.start();
    assert(eventually([&] { return monitor.waiting_count() == 1; }));
    assert(!monitor.mutex().is_locked());

    g_runtime.run(monitor.synchronized([&]() -> coro_task<void> {
      ++items;
      monitor.notify();
      co_return;
    }));

    assert(task.get());
    assert(items == 0);
    assert(monitor.waiting_count() == 0);
    assert(!monitor.mutex().is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("monitor wait_while times out holding the monitor") {
    async_monitor monitor;
    bool held_after = false;
    bool ok = g_runtime.run(monitor.synchronized([&]() -> coro_task<bool> {
      bool result = co_await monitor.wait_while([] { return true; }, 20ms);
      held_after = monitor.mutex().is_locked();
      co_return result;
    }));
    assert(!ok);
    assert(held_after);
    assert(monitor.waiting_count() == 0);
    assert(!monitor.mutex().is_locked());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("monitor notify_all wakes every waiter") {
    async_monitor monitor;
    bool ready = false;
    auto waiter = [&]() -> coro_task<bool> {
      co_return co_await monitor.synchronized([&]() -> coro_task<bool> {
        co_return co_await monitor.wait_until([&] { return ready; }, 2s);
      });
    };
    std::vector<coro_task<bool>> tasks;
    for (int i = 0; i < 3; ++i) {
      tasks.push_back(waiter());
      tasks.back().start();
    }
    assert(eventually([&] { return monitor.waiting_count() == 3; }));

    g_runtime.run(monitor.synchronized([&]() -> coro_task<void> {
      ready = true;
      monitor.notify_all();
      co_return;
    }));
    for (auto &t : tasks)
      assert(t.get());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("monitor keeps a re-waiting caller ahead of later waiters") {
    async_monitor monitor;
    std::mutex log_mutex;
    std::string checks;
    bool a_done = false;
    bool b_done = false;
    auto waiter = [&](char name, bool &done) -> coro_task<bool> {
      co_return co_await monitor.synchronized([&, name]() -> coro_task<bool> {
        co_return co_await monitor.wait_until(
            [&, name] {
              std::lock_guard lock(log_mutex);
              checks.push_back(name);
              return done;
            },
            2s);
      });
    };
    auto log_size = [&] {
      std::lock_guard lock(log_mutex);
      return checks.size();
    };

    auto first = waiter('A', a_done);
    first.start();
    assert(eventually([&] { return monitor.waiting_count() == 1; }));
    auto second = waiter('B', b_done);
    second.start();
    assert(eventually([&] { return monitor.waiting_count() == 2; }));

    // A wakes, finds its condition unmet and waits again
    monitor.notify();
    assert(eventually([&] {
      return log_size() == 3 && monitor.waiting_count() == 2;
    }));

    monitor.notify();
    assert(eventually([&] { return log_size() == 4; }));
    {
      std::lock_guard lock(log_mutex);
      assert(checks == "ABAA");
    }

    g_runtime.run(monitor.synchronized([&]() -> coro_task<void> {
      a_done = true;
      b_done = true;
      monitor.notify_all();
      co_return;
    }));
    assert(first.get());
    assert(second.get());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("monitor wait_while requires the monitor") {
    async_monitor monitor;
    assert(throws_as<std::logic_error>([&] {
      g_runtime.run(monitor.wait_while([] { return true; }));
    }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Barrier Tests
// =============================================================================

struct timeout_counter : barrier_observer {
  std::atomic<int> timeouts{0};
  void on_timeout() override { timeouts.fetch_add(1); }
};

void test_barrier() {
  TEST("barrier rejects zero parties") {
    assert(throws_as<invalid_configuration_exception>(
        [] { async_barrier barrier(barrier_options{}); }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("barrier releases all parties and runs the action once") {
    std::atomic<int> actions{0};
    barrier_options options;
    options.parties = 3;
    options.action = [&] { actions.fetch_add(1); };
    async_barrier barrier(options);

    std::atomic<int> passed{0};
    auto party = [&]() -> coro_task<void> {
      co_await barrier.arrive_and_wait();
      passed.fetch_add(1);
    };
    auto runner = [&]() -> coro_task<void> {
      std::vector<coro_task<void>> tasks;
      for (int i = 0; i < 3; ++i)
        tasks.push_back(party());
      co_await when_all(std::move(tasks));
    };
    g_runtime.run(runner());

    assert(passed.load() == 3);
    assert(actions.load() == 1);
    // One-shot barriers are spent after releasing
    assert(barrier.is_broken());
    assert(throws_as<broken_barrier_exception>(
        [&] { g_runtime.run(party()); }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cyclic barrier serves repeated generations") {
    std::atomic<int> actions{0};
    barrier_options options;
    options.parties = 2;
    options.cyclic = true;
    options.action = [&] { actions.fetch_add(1); };
    async_barrier barrier(options);

    auto party = [&]() -> coro_task<void> {
      for (int round = 0; round < 3; ++round)
        co_await barrier.arrive_and_wait();
    };
    auto runner = [&]() -> coro_task<void> {
      std::vector<coro_task<void>> tasks;
      tasks.push_back(party());
      tasks.push_back(party());
      co_await when_all(std::move(tasks));
    };
    g_runtime.run(runner());

    assert(actions.load() == 3);
    assert(!barrier.is_broken());
    assert(barrier.arrived_count() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("barrier timeout breaks it and fails every waiter") {
    auto observer = std::make_shared<timeout_counter>();
    barrier_options options;
    options.parties = 3;
    options.timeout = 30ms;
    options.observer = observer;
    async_barrier barrier(options);

    auto party = [&]() -> coro_task<bool> {
      try {
        co_await barrier.arrive_and_wait();
      } catch (const timeout_exception &) {
        co_return true;
      }
      co_return false;
    };
    auto first = party();
    auto second = party();
    first.start();
    second.start();

    assert(first.get());
    assert(second.get());
    assert(observer->timeouts.load() == 1);
    assert(barrier.is_broken());
    assert(barrier.arrived_count() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("barrier action failure breaks the barrier") {
    barrier_options options;
    options.parties = 2;
    options.action = [] { throw std::runtime_error("action failed"); };
    async_barrier barrier(options);

    auto waiter = [&]() -> coro_task<bool> {
      try {
        co_await barrier.arrive_and_wait();
      } catch (const broken_barrier_exception &) {
        co_return true;
      }
      co_return false;
    };
    auto first = waiter();
    first.start();
    assert(eventually([&] { return barrier.arrived_count() == 1; }));

    bool action_error = false;
    try {
      g_runtime.run([&]() -> coro_task<void> {
        co_await barrier.arrive_and_wait();
      }());
    } catch (const std::runtime_error &e) {
      action_error = std::string(e.what()) == "action failed";
    }
    assert(action_error);
    assert(first.get());
    assert(barrier.is_broken());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("barrier reset fails pending waiters and restores it") {
    barrier_options options;
    options.parties = 3;
    async_barrier barrier(options);

    auto waiter = [&]() -> coro_task<bool> {
      try {
        co_await barrier.arrive_and_wait();
      } catch (const broken_barrier_exception &) {
        co_return true;
      }
      co_return false;
    };
    auto pending = waiter();
    pending.start();
    assert(eventually([&] { return barrier.arrived_count() == 1; }));

    barrier.reset();
    assert(pending.get());
    assert(!barrier.is_broken());
    assert(barrier.arrived_count() == 0);
    assert(barrier.parties() == 3);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Countdown Latch Tests
// =============================================================================

struct completion_counter : latch_observer {
  std::atomic<int> completions{0};
  void on_complete() override { completions.fetch_add(1); }
};

void test_latch() {
  TEST("latch releases waiters at zero") {
    auto observer = std::make_shared<completion_counter>();
    async_countdown_latch latch(3, observer);
    auto waiter = [&]() -> coro_task<bool> { co_return co_await latch.wait(); };
    auto task = waiter();
    task.start();

    latch.count_down();
    latch.count_down();
    assert(latch.count() == 1);
    assert(!latch.is_complete());
    latch.count_down();

    assert(task.get());
    assert(latch.is_complete());
    assert(observer->completions.load() == 1);
    assert(throws_as<latch_underflow_exception>([&] { latch.count_down(); }));
    assert(latch.count() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("latch wait times out without touching the count") {
    async_countdown_latch latch(2);
    bool done = g_runtime.run(
        [&]() -> coro_task<bool> { co_return co_await latch.wait(20ms); }());
    assert(!done);
    assert(latch.count() == 2);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completed latch returns immediately; reset restores the count") {
    async_countdown_latch latch(1);
    latch.count_down();
    assert(g_runtime.run(
        [&]() -> coro_task<bool> { co_return co_await latch.wait(1ms); }()));
    latch.reset();
    assert(latch.count() == 1);
    assert(latch.initial_count() == 1);
    assert(!latch.is_complete());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("latch execute counts down after the work") {
    async_countdown_latch latch(2);
    int value = g_runtime.run(
        latch.execute([]() -> coro_task<int> { co_return 11; }));
    assert(value == 11);
    assert(latch.count() == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Reader-Writer Lock Tests
// =============================================================================

void test_rw_lock() {
  TEST("rw_lock admits concurrent readers") {
    async_rw_lock lock;
    auto first = g_runtime.run(lock.scoped_read());
    auto second = g_runtime.run(lock.scoped_read());
    assert(lock.reader_count() == 2);
    assert(!lock.is_writing());
    first.unlock();
    second.unlock();
    assert(lock.reader_count() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rw_lock writer waits for readers and excludes them") {
    async_rw_lock lock;
    auto reader = g_runtime.run(lock.scoped_read());

    std::atomic<bool> saw_exclusive{false};
    auto writer = lock.write_lock([&]() -> coro_task<void> {
      saw_exclusive = lock.is_writing() && lock.reader_count() == 0;
      co_return;
    });
    writer.start();
    assert(eventually([&] { return lock.queued_writers() == 1; }));

    reader.unlock();
    writer.get();
    assert(saw_exclusive.load());
    assert(!lock.is_writing());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rw_lock writer priority holds back new readers") {
    async_rw_lock lock(true);
    order_log log;
    auto reader = g_runtime.run(lock.scoped_read());

    auto writer = lock.write_lock([&]() -> coro_task<void> {
      log.push(1);
      co_return;
    });
    writer.start();
    assert(eventually([&] { return lock.queued_writers() == 1; }));

    auto late_reader = lock.read_lock([&]() -> coro_task<void> {
      log.push(2);
      co_return;
    });
    late_reader.start();
    assert(eventually([&] { return lock.queued_readers() == 1; }));

    reader.unlock();
    writer.get();
    late_reader.get();
    assert((log.snapshot() == std::vector<int>{1, 2}));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rw_lock timed-out writer unblocks queued readers") {
    async_rw_lock lock(true);
    auto reader = g_runtime.run(lock.scoped_read());

    auto writer = [&]() -> coro_task<bool> {
      try {
        co_await lock.acquire_write(150ms);
      } catch (const timeout_exception &) {
        co_return true;
      }
      lock.release_write();
      co_return false;
    };
    auto writer_task = writer();
    writer_task.start();
    assert(eventually([&] { return lock.queued_writers() == 1; }));

    auto late_reader = lock.read_lock([]() -> coro_task<int> { co_return 5; });
    late_reader.start();
    assert(eventually([&] { return lock.queued_readers() == 1; }));

    assert(writer_task.get());
    // The reader gets in while the first reader still holds the lock
    assert(late_reader.get() == 5);
    assert(lock.reader_count() == 1);
    reader.unlock();
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rw_lock release without a hold is a logic error") {
    async_rw_lock lock;
    assert(throws_as<std::logic_error>([&] { lock.release_read(); }));
    assert(throws_as<std::logic_error>([&] { lock.release_write(); }));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

int main() {
  std::cout << "=== flowgate primitive tests ===" << std::endl;

  test_semaphore();
  test_mutex();
  test_monitor();
  test_barrier();
  test_latch();
  test_rw_lock();

  std::cout << std::endl
            << "Results: " << tests_passed << " passed, " << tests_failed
            << " failed" << std::endl;
  return tests_failed > 0 ? 1 : 0;
}
