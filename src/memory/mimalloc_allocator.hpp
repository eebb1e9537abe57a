#pragma once

#include "memory/basic_allocator_impl.hpp"

namespace autoalloc {
namespace memory {

// HighPerformanceGeneral backend served by mimalloc.
class MimallocAllocator final : public BasicAllocator<MimallocAllocator> {
 public:
  MimallocAllocator();
  ~MimallocAllocator() override;

  const char* Name() const override;
  const char* BackendName() const override;
  AllocatorType Type() const override;
  void Release() override;
  AllocatorCaps Caps() const override;

 private:
  friend class BasicAllocator<MimallocAllocator>;

  static const char* AllocFunctionName();
  void* BackendAllocate(std::size_t size, std::size_t alignment);
  void BackendFree(void* ptr);
  std::size_t BackendUsableSize(void* ptr) const;
};

}  // namespace memory
}  // namespace autoalloc
