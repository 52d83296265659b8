#ifndef FLOWGATE_CONFIG_HPP
#define FLOWGATE_CONFIG_HPP

#include <cstddef>

namespace flowgate {

// Process-wide runtime settings. Controllers are configured through their own
// options structs; this only covers the shared scheduler.
struct runtime_config {
  // Number of coroutine worker threads (always at least one)
  std::size_t worker_threads{1};

  // Reads FLOWGATE_WORKER_THREADS, falling back to hardware_concurrency().
  // Values above max_worker_threads() are clamped.
  static runtime_config from_environment();

  static std::size_t max_worker_threads();
};

} // namespace flowgate

#endif
