#include "flowgate/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace flowgate {

static constexpr const char *WORKER_THREADS_ENV = "FLOWGATE_WORKER_THREADS";
static constexpr std::size_t MIN_WORKER_CAP = 64;

std::size_t runtime_config::max_worker_threads() {
  std::size_t hw = std::thread::hardware_concurrency();
  return std::max<std::size_t>(4 * hw, MIN_WORKER_CAP);
}

runtime_config runtime_config::from_environment() {
  runtime_config config;
  std::size_t hw = std::thread::hardware_concurrency();
  config.worker_threads = hw > 0 ? hw : 1;

  const char *raw = std::getenv(WORKER_THREADS_ENV);
  if (!raw || *raw == '\0')
    return config;

  // strtoull would wrap a negative value around
  const char *digits = raw;
  while (std::isspace(static_cast<unsigned char>(*digits)))
    ++digits;

  char *end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(digits, &end, 10);
  if (*digits == '-' || errno != 0 || end == digits || *end != '\0' ||
      parsed == 0) {
    std::fprintf(stderr, "[config] ignoring %s=\"%s\": expected a positive integer\n",
                 WORKER_THREADS_ENV, raw);
    return config;
  }

  std::size_t cap = max_worker_threads();
  if (parsed > cap) {
    std::fprintf(stderr, "[config] %s=%llu exceeds %zu, clamping\n",
                 WORKER_THREADS_ENV, parsed, cap);
    parsed = cap;
  }

  config.worker_threads = static_cast<std::size_t>(parsed);
  return config;
}

} // namespace flowgate
