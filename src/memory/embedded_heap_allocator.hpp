#pragma once

#include <atomic>

#include "autoalloc/selection/platform_defines.hpp"
#include "memory/basic_allocator_impl.hpp"

namespace autoalloc {
namespace memory {

// EmbeddedHeap backend: bump allocation over a fixed arena held inside the
// object. The arena rewinds once every live block has been freed.
class EmbeddedHeapAllocator final : public BasicAllocator<EmbeddedHeapAllocator> {
 public:
  static const std::size_t kArenaSize = AUTOALLOC_EMBEDDED_HEAP_SIZE;

  EmbeddedHeapAllocator();
  ~EmbeddedHeapAllocator() override;

  const char* Name() const override;
  const char* BackendName() const override;
  AllocatorType Type() const override;
  void Release() override;
  AllocatorCaps Caps() const override;

  // Bytes of the arena consumed so far, headers and padding included.
  std::size_t ArenaUsed() const;
  std::size_t LiveBlocks() const;

  bool Owns(const void* ptr) const;

 private:
  friend class BasicAllocator<EmbeddedHeapAllocator>;

  class SpinGuard {
   public:
    explicit SpinGuard(std::atomic_flag* flag);
    ~SpinGuard();

   private:
    std::atomic_flag* flag_;
  };

  static const char* AllocFunctionName();
  void* BackendAllocate(std::size_t size, std::size_t alignment);
  void BackendFree(void* ptr);
  std::size_t BackendUsableSize(void* ptr) const;

  alignas(16) unsigned char arena_[kArenaSize];
  std::size_t top_;
  std::size_t live_blocks_;
  mutable std::atomic_flag lock_;
};

}  // namespace memory
}  // namespace autoalloc
