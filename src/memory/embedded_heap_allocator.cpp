#include "memory/embedded_heap_allocator.hpp"

#include <cstdint>
#include <cstring>

namespace autoalloc {
namespace memory {

namespace {

std::size_t AlignUp(std::size_t value, std::size_t alignment) {
  return (value + alignment - 1) & ~(alignment - 1);
}

}  // namespace

const std::size_t EmbeddedHeapAllocator::kArenaSize;

EmbeddedHeapAllocator::SpinGuard::SpinGuard(std::atomic_flag* flag) : flag_(flag) {
  while (flag_->test_and_set(std::memory_order_acquire)) {
  }
}

EmbeddedHeapAllocator::SpinGuard::~SpinGuard() { flag_->clear(std::memory_order_release); }

EmbeddedHeapAllocator::EmbeddedHeapAllocator() : top_(0), live_blocks_(0) {
  lock_.clear();
}

EmbeddedHeapAllocator::~EmbeddedHeapAllocator() {}

const char* EmbeddedHeapAllocator::Name() const {
  return "autoalloc.memory.embedded_heap_allocator";
}

const char* EmbeddedHeapAllocator::BackendName() const { return "embedded-arena"; }
AllocatorType EmbeddedHeapAllocator::Type() const { return AllocatorType::kEmbeddedHeap; }
void EmbeddedHeapAllocator::Release() { delete this; }

AllocatorCaps EmbeddedHeapAllocator::Caps() const {
  AllocatorCaps caps;
  caps.supports_aligned_alloc = true;
  caps.thread_safe = true;
  caps.scrubs_on_free = false;
  caps.bounded_capacity = true;
  return caps;
}

std::size_t EmbeddedHeapAllocator::ArenaUsed() const {
  SpinGuard guard(&lock_);
  return top_;
}

std::size_t EmbeddedHeapAllocator::LiveBlocks() const {
  SpinGuard guard(&lock_);
  return live_blocks_;
}

bool EmbeddedHeapAllocator::Owns(const void* ptr) const {
  const std::uintptr_t p = reinterpret_cast<std::uintptr_t>(ptr);
  const std::uintptr_t begin = reinterpret_cast<std::uintptr_t>(arena_);
  return p >= begin + sizeof(std::size_t) && p < begin + kArenaSize;
}

const char* EmbeddedHeapAllocator::AllocFunctionName() { return "embedded arena"; }

void* EmbeddedHeapAllocator::BackendAllocate(std::size_t size, std::size_t alignment) {
  SpinGuard guard(&lock_);
  const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(arena_);
  // The block size is stored in the word right before the returned address.
  const std::uintptr_t user =
      AlignUp(static_cast<std::size_t>(base + top_ + sizeof(std::size_t)), alignment);
  const std::size_t user_offset = static_cast<std::size_t>(user - base);
  if (user_offset > kArenaSize || size > kArenaSize - user_offset) {
    return NULL;
  }
  std::memcpy(arena_ + user_offset - sizeof(std::size_t), &size, sizeof(size));
  top_ = user_offset + size;
  ++live_blocks_;
  return arena_ + user_offset;
}

void EmbeddedHeapAllocator::BackendFree(void* ptr) {
  if (!Owns(ptr)) {
    return;
  }
  SpinGuard guard(&lock_);
  if (live_blocks_ == 0) {
    return;
  }
  --live_blocks_;
  if (live_blocks_ == 0) {
    top_ = 0;
  }
}

std::size_t EmbeddedHeapAllocator::BackendUsableSize(void* ptr) const {
  if (!Owns(ptr)) {
    return 0;
  }
  std::size_t size = 0;
  std::memcpy(&size, static_cast<unsigned char*>(ptr) - sizeof(std::size_t), sizeof(size));
  return size;
}

}  // namespace memory
}  // namespace autoalloc
