#include "memory/tbb_allocator.hpp"

#include <tbb/scalable_allocator.h>

namespace autoalloc {
namespace memory {

TbbAllocator::TbbAllocator() {}
TbbAllocator::~TbbAllocator() {}

const char* TbbAllocator::Name() const { return "autoalloc.memory.tbb_allocator"; }
const char* TbbAllocator::BackendName() const { return "tbbmalloc"; }
AllocatorType TbbAllocator::Type() const { return AllocatorType::kHighPerformanceGeneral; }
void TbbAllocator::Release() { delete this; }

AllocatorCaps TbbAllocator::Caps() const {
  AllocatorCaps caps;
  caps.supports_aligned_alloc = true;
  caps.thread_safe = true;
  caps.scrubs_on_free = false;
  caps.bounded_capacity = false;
  return caps;
}

const char* TbbAllocator::AllocFunctionName() { return "scalable_aligned_malloc"; }

void* TbbAllocator::BackendAllocate(std::size_t size, std::size_t alignment) {
  return scalable_aligned_malloc(size, alignment);
}

void TbbAllocator::BackendFree(void* ptr) { scalable_aligned_free(ptr); }

std::size_t TbbAllocator::BackendUsableSize(void* ptr) const { return scalable_msize(ptr); }

}  // namespace memory
}  // namespace autoalloc
