#pragma once

#include <cstddef>
#include <new>
#include <utility>

#include "autoalloc/api/export.hpp"
#include "autoalloc/memory/iallocator.hpp"
#include "autoalloc/selection/selection_policy.hpp"

namespace autoalloc {
namespace memory {

// Process-wide binding of one backend. The first call that needs memory (or
// an explicit Bind()) runs the selection once and freezes the result; the
// binding never changes afterwards.
class AUTOALLOC_API GlobalAllocator {
 public:
  // Resolves the platform profile, probes hardware only when the rule table
  // needs it, applies a build-time pin (AUTOALLOC_FORCE_BACKEND) and freezes
  // the decision. Later calls return the frozen decision without locking.
  // Does not allocate and does not log, so it is safe from operator new.
  static const selection::SelectionDecision& Bind();

  static bool IsBound();

  // Bound backend kind. Binds on first use.
  static AllocatorType BoundType();

  // Allocates through the bound backend. Binds on first use.
  // Params:
  // - size: requested bytes, must be > 0.
  // - alignment: power of two, >= sizeof(void*).
  // Returns:
  // - kOk: value holds a block owned by the bound backend.
  // - kInvalidArgument: bad size or alignment.
  // - kInternalError: the backend could not satisfy the request (an
  //   EmbeddedHeap arena is full, for instance).
  // Thread safety: thread safe.
  static api::Result<void*> Allocate(std::size_t size, std::size_t alignment);

  // Frees a block returned by Allocate or AllocateRaw. The block must come
  // from this process's bound backend.
  // Params:
  // - ptr: block to free; NULL is a no-op.
  // Returns:
  // - kOk: always; the backends have no failing free path.
  // Thread safety: thread safe.
  static api::Status Deallocate(void* ptr);

  // Status-free variants for the operator new/delete replacements.
  static void* AllocateRaw(std::size_t size, std::size_t alignment);
  static void DeallocateRaw(void* ptr);

  // Backend metadata.
  static const char* BackendDisplayName(AllocatorType type);
  static bool IsBackendEnabled(AllocatorType type);

  // Runtime observability helpers for the bound backend.
  static const char* CurrentBackendName();
  static AllocatorCaps CurrentCaps();
  static AllocatorStats CurrentStats();
  static void ResetCurrentStats();
};

inline void* GlobalAllocOrNull(std::size_t size, std::size_t alignment) {
  const std::size_t normalized = alignment < sizeof(void*) ? sizeof(void*) : alignment;
  api::Result<void*> r = GlobalAllocator::Allocate(size, normalized);
  return r.ok() ? r.value() : NULL;
}

inline void GlobalFreeIgnore(void* ptr) {
  (void)GlobalAllocator::Deallocate(ptr);
}

template <typename T, typename... Args>
T* GlobalNew(Args&&... args) {
  void* raw = GlobalAllocOrNull(sizeof(T), alignof(T));
  if (raw == NULL) return NULL;
  try {
    return new (raw) T(std::forward<Args>(args)...);
  } catch (...) {
    GlobalFreeIgnore(raw);
    throw;
  }
}

template <typename T>
void GlobalDelete(T* ptr) {
  if (ptr == NULL) return;
  ptr->~T();
  GlobalFreeIgnore(static_cast<void*>(ptr));
}

}  // namespace memory
}  // namespace autoalloc

#define AUTOALLOC_ALLOC(bytes) \
  ::autoalloc::memory::GlobalAllocOrNull((bytes), alignof(std::max_align_t))

#define AUTOALLOC_ALLOC_ALIGNED(bytes, alignment) \
  ::autoalloc::memory::GlobalAllocOrNull((bytes), (alignment))

#define AUTOALLOC_FREE(ptr) ::autoalloc::memory::GlobalFreeIgnore((ptr))

#define AUTOALLOC_NEW(Type, ...) ::autoalloc::memory::GlobalNew<Type>(__VA_ARGS__)

#define AUTOALLOC_DELETE(ptr) ::autoalloc::memory::GlobalDelete((ptr))
