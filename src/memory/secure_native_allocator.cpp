#include "memory/secure_native_allocator.hpp"

#include <cstring>

#include "memory/native_heap.hpp"

namespace autoalloc {
namespace memory {

namespace {

// Header in front of each block so the scrub length is known even where the
// platform has no usable-size query.
struct SecureBlockHeader {
  std::size_t user_size;
  std::size_t offset;
};

std::size_t HeaderSpan(std::size_t alignment) {
  std::size_t span = sizeof(SecureBlockHeader);
  if (span % alignment != 0) {
    span += alignment - span % alignment;
  }
  return span;
}

SecureBlockHeader* HeaderOf(void* ptr) {
  return reinterpret_cast<SecureBlockHeader*>(static_cast<unsigned char*>(ptr) -
                                              sizeof(SecureBlockHeader));
}

}  // namespace

SecureNativeAllocator::SecureNativeAllocator() {}
SecureNativeAllocator::~SecureNativeAllocator() {}

const char* SecureNativeAllocator::Name() const {
  return "autoalloc.memory.secure_native_allocator";
}

const char* SecureNativeBackendName() {
#if defined(__ANDROID__)
  return "scudo";
#elif defined(__APPLE__)
  return "libmalloc";
#elif defined(__OpenBSD__)
  return "otto-malloc";
#else
  return "native-scrubbed";
#endif
}

const char* SecureNativeAllocator::BackendName() const { return SecureNativeBackendName(); }

AllocatorType SecureNativeAllocator::Type() const { return AllocatorType::kPlatformSecureNative; }
void SecureNativeAllocator::Release() { delete this; }

AllocatorCaps SecureNativeAllocator::Caps() const {
  AllocatorCaps caps;
  caps.supports_aligned_alloc = true;
  caps.thread_safe = true;
  caps.scrubs_on_free = true;
  caps.bounded_capacity = false;
  return caps;
}

const char* SecureNativeAllocator::AllocFunctionName() { return "secure native allocation"; }

void* SecureNativeAllocator::BackendAllocate(std::size_t size, std::size_t alignment) {
  const std::size_t span = HeaderSpan(alignment);
  if (size > static_cast<std::size_t>(-1) - span) {
    return NULL;
  }
  void* base = NativeAlignedAlloc(span + size, alignment);
  if (base == NULL) {
    return NULL;
  }
  void* user = static_cast<unsigned char*>(base) + span;
  SecureBlockHeader header;
  header.user_size = size;
  header.offset = span;
  std::memcpy(HeaderOf(user), &header, sizeof(header));
  return user;
}

void SecureNativeAllocator::BackendFree(void* ptr) {
  SecureBlockHeader* header = HeaderOf(ptr);
  const std::size_t span = header->offset;
  void* base = static_cast<unsigned char*>(ptr) - span;
  SecureZero(base, span + header->user_size);
  NativeAlignedFree(base);
}

std::size_t SecureNativeAllocator::BackendUsableSize(void* ptr) const {
  return HeaderOf(ptr)->user_size;
}

}  // namespace memory
}  // namespace autoalloc
