// Replaces the global operator new/delete so every C++ dynamic allocation of
// the linking program is served by the backend GlobalAllocator binds. Link
// the autoalloc_new_delete object library exactly once per program.

#include <cstddef>
#include <new>

#include "autoalloc/memory/i_global_allocator.hpp"

namespace {

const std::size_t kDefaultNewAlignment = alignof(std::max_align_t);

void* AllocateOrNull(std::size_t size, std::size_t alignment) {
  if (size == 0) size = 1;
  return ::autoalloc::memory::GlobalAllocator::AllocateRaw(size, alignment);
}

void* AllocateOrThrow(std::size_t size, std::size_t alignment) {
  while (true) {
    void* ptr = AllocateOrNull(size, alignment);
    if (ptr != NULL) {
      return ptr;
    }
    std::new_handler handler = std::get_new_handler();
    if (handler == NULL) {
      throw std::bad_alloc();
    }
    handler();
  }
}

void Release(void* ptr) { ::autoalloc::memory::GlobalAllocator::DeallocateRaw(ptr); }

}  // namespace

void* operator new(std::size_t size) { return AllocateOrThrow(size, kDefaultNewAlignment); }

void* operator new[](std::size_t size) { return AllocateOrThrow(size, kDefaultNewAlignment); }

void* operator new(std::size_t size, const std::nothrow_t&) noexcept {
  return AllocateOrNull(size, kDefaultNewAlignment);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept {
  return AllocateOrNull(size, kDefaultNewAlignment);
}

void operator delete(void* ptr) noexcept { Release(ptr); }
void operator delete[](void* ptr) noexcept { Release(ptr); }
void operator delete(void* ptr, const std::nothrow_t&) noexcept { Release(ptr); }
void operator delete[](void* ptr, const std::nothrow_t&) noexcept { Release(ptr); }

#if defined(__cpp_sized_deallocation)
void operator delete(void* ptr, std::size_t) noexcept { Release(ptr); }
void operator delete[](void* ptr, std::size_t) noexcept { Release(ptr); }
#endif

#if defined(__cpp_aligned_new)
namespace {

std::size_t NewAlignment(std::align_val_t alignment) {
  const std::size_t value = static_cast<std::size_t>(alignment);
  return value < sizeof(void*) ? sizeof(void*) : value;
}

}  // namespace

void* operator new(std::size_t size, std::align_val_t alignment) {
  return AllocateOrThrow(size, NewAlignment(alignment));
}

void* operator new[](std::size_t size, std::align_val_t alignment) {
  return AllocateOrThrow(size, NewAlignment(alignment));
}

void* operator new(std::size_t size, std::align_val_t alignment, const std::nothrow_t&) noexcept {
  return AllocateOrNull(size, NewAlignment(alignment));
}

void* operator new[](std::size_t size, std::align_val_t alignment,
                     const std::nothrow_t&) noexcept {
  return AllocateOrNull(size, NewAlignment(alignment));
}

void operator delete(void* ptr, std::align_val_t) noexcept { Release(ptr); }
void operator delete[](void* ptr, std::align_val_t) noexcept { Release(ptr); }
void operator delete(void* ptr, std::size_t, std::align_val_t) noexcept { Release(ptr); }
void operator delete[](void* ptr, std::size_t, std::align_val_t) noexcept { Release(ptr); }
#endif
