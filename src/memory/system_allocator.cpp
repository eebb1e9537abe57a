#include "memory/system_allocator.hpp"

#include "memory/native_heap.hpp"

namespace autoalloc {
namespace memory {

SystemAllocator::SystemAllocator() {}
SystemAllocator::~SystemAllocator() {}

const char* SystemAllocator::Name() const { return "autoalloc.memory.system_allocator"; }
const char* SystemAllocator::BackendName() const { return "system"; }
AllocatorType SystemAllocator::Type() const { return AllocatorType::kSystem; }
void SystemAllocator::Release() { delete this; }

AllocatorCaps SystemAllocator::Caps() const {
  AllocatorCaps caps;
  caps.supports_aligned_alloc = true;
  caps.thread_safe = true;
  caps.scrubs_on_free = false;
  caps.bounded_capacity = false;
  return caps;
}

const char* SystemAllocator::AllocFunctionName() {
#if defined(_WIN32)
  return "_aligned_malloc";
#else
  return "posix_memalign";
#endif
}

void* SystemAllocator::BackendAllocate(std::size_t size, std::size_t alignment) {
  return NativeAlignedAlloc(size, alignment);
}

void SystemAllocator::BackendFree(void* ptr) { NativeAlignedFree(ptr); }

std::size_t SystemAllocator::BackendUsableSize(void* ptr) const { return NativeUsableSize(ptr); }

}  // namespace memory
}  // namespace autoalloc
