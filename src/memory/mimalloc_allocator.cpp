#include "memory/mimalloc_allocator.hpp"

#include <mimalloc.h>

namespace autoalloc {
namespace memory {

MimallocAllocator::MimallocAllocator() {}
MimallocAllocator::~MimallocAllocator() {}

const char* MimallocAllocator::Name() const { return "autoalloc.memory.mimalloc_allocator"; }
const char* MimallocAllocator::BackendName() const { return "mimalloc"; }
AllocatorType MimallocAllocator::Type() const { return AllocatorType::kHighPerformanceGeneral; }
void MimallocAllocator::Release() { delete this; }

AllocatorCaps MimallocAllocator::Caps() const {
  AllocatorCaps caps;
  caps.supports_aligned_alloc = true;
  caps.thread_safe = true;
  caps.scrubs_on_free = false;
  caps.bounded_capacity = false;
  return caps;
}

const char* MimallocAllocator::AllocFunctionName() { return "mi_malloc_aligned"; }

void* MimallocAllocator::BackendAllocate(std::size_t size, std::size_t alignment) {
  return mi_malloc_aligned(size, alignment);
}

void MimallocAllocator::BackendFree(void* ptr) { mi_free(ptr); }

std::size_t MimallocAllocator::BackendUsableSize(void* ptr) const { return mi_usable_size(ptr); }

}  // namespace memory
}  // namespace autoalloc
