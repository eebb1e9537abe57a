#pragma once

#include "memory/basic_allocator_impl.hpp"

namespace autoalloc {
namespace memory {

// Name of the native allocator serving PlatformSecureNative on this platform.
const char* SecureNativeBackendName();

// PlatformSecureNative backend: the platform C allocator (hardened on Android,
// iOS and OpenBSD) with every block zeroed before it goes back to the heap.
class SecureNativeAllocator final : public BasicAllocator<SecureNativeAllocator> {
 public:
  SecureNativeAllocator();
  ~SecureNativeAllocator() override;

  const char* Name() const override;
  const char* BackendName() const override;
  AllocatorType Type() const override;
  void Release() override;
  AllocatorCaps Caps() const override;

 private:
  friend class BasicAllocator<SecureNativeAllocator>;

  static const char* AllocFunctionName();
  void* BackendAllocate(std::size_t size, std::size_t alignment);
  void BackendFree(void* ptr);
  std::size_t BackendUsableSize(void* ptr) const;
};

}  // namespace memory
}  // namespace autoalloc
