#include "flowgate/control/bulkhead.hpp"
#include "flowgate/errors.hpp"

#include <stdexcept>

namespace flowgate {

bulkhead::bulkhead(bulkhead_options options) : options_(std::move(options)) {
  if (options_.pool_size == 0)
    throw invalid_configuration_exception(
        "bulkhead pool_size must be greater than zero");
  if (!options_.observer)
    options_.observer = std::make_shared<bulkhead_observer>();

  pools_.reserve(options_.pool_size);
  for (std::size_t i = 0; i < options_.pool_size; ++i)
    pools_.push_back(std::make_unique<async_semaphore>(1));
}

async_semaphore &bulkhead::next_pool() {
  std::size_t index = next_.fetch_add(1, std::memory_order_relaxed);
  return *pools_[index % pools_.size()];
}

std::size_t bulkhead::available_pools() const {
  std::size_t available = 0;
  for (const auto &pool : pools_)
    available += pool->available_permits();
  return available;
}

std::size_t bulkhead::queued_in_pool(std::size_t index) const {
  if (index >= pools_.size())
    throw std::out_of_range("bulkhead pool index out of range");
  return pools_[index]->queue_length();
}

} // namespace flowgate
