#pragma once

#include "memory/basic_allocator_impl.hpp"

namespace autoalloc {
namespace memory {

// HighPerformanceGeneral backend served by oneTBB's scalable allocator.
// Bound only when mimalloc is not compiled in.
class TbbAllocator final : public BasicAllocator<TbbAllocator> {
 public:
  TbbAllocator();
  ~TbbAllocator() override;

  const char* Name() const override;
  const char* BackendName() const override;
  AllocatorType Type() const override;
  void Release() override;
  AllocatorCaps Caps() const override;

 private:
  friend class BasicAllocator<TbbAllocator>;

  static const char* AllocFunctionName();
  void* BackendAllocate(std::size_t size, std::size_t alignment);
  void BackendFree(void* ptr);
  std::size_t BackendUsableSize(void* ptr) const;
};

}  // namespace memory
}  // namespace autoalloc
