#pragma once

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace flowgate {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;
};

// Install mimalloc as the global default PMR resource.
// Called once from the task_scheduler constructor, before workers start.
void init_allocator();

// Resource used by waiter queues, wake gates and controller buffers.
std::pmr::memory_resource* mi_resource() noexcept;

// Allocator for containers that hold per-call bookkeeping
template <typename T = std::byte>
std::pmr::polymorphic_allocator<T> waiter_allocator() noexcept {
  return std::pmr::polymorphic_allocator<T>(mi_resource());
}

}  // namespace flowgate
