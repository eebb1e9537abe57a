#pragma once

#include <cstddef>
#include <cstdint>

#include "autoalloc/api/export.hpp"
#include "autoalloc/api/status.hpp"
#include "autoalloc/api/version.hpp"

namespace autoalloc {
namespace memory {

// Closed set of backend kinds. Exactly one is bound per process.
enum class AllocatorType {
  kSystem = 0,
  kHighPerformanceGeneral = 1,
  kPlatformSecureNative = 2,
  kEmbeddedHeap = 3
};

static const int kAllocatorTypeCount = 4;

AUTOALLOC_API const char* AllocatorTypeName(AllocatorType type);

struct AllocatorCaps {
  bool supports_aligned_alloc = true;
  bool thread_safe = true;
  bool scrubs_on_free = false;
  bool bounded_capacity = false;
};

struct AllocatorStats {
  std::uint64_t alloc_count = 0;
  std::uint64_t free_count = 0;
  std::uint64_t alloc_fail_count = 0;
  std::uint64_t bytes_in_use = 0;
  std::uint64_t bytes_peak = 0;
};

class IAllocator {
 public:
  virtual ~IAllocator() {}

  // Implementation name, used in logs to pin down which adapter is live.
  virtual const char* Name() const = 0;

  // Name of the library actually serving memory ("mimalloc", "tbbmalloc", ...).
  virtual const char* BackendName() const = 0;

  // Backend kind this adapter stands for.
  virtual AllocatorType Type() const = 0;

  // Interface version the object follows. Lets a caller check that the shared
  // library matches the headers it was compiled against.
  virtual std::uint32_t ApiVersion() const = 0;

  // Destroys the instance. The pointer is invalid afterwards.
  virtual void Release() = 0;

  virtual AllocatorCaps Caps() const = 0;
  virtual AllocatorStats Stats() const = 0;

  // Resets counters; bytes_in_use is kept and becomes the new peak.
  virtual void ResetStats() = 0;

  // Allocates an aligned block.
  // Params:
  // - size: requested bytes, must be > 0.
  // - alignment: power of two, >= sizeof(void*).
  // Returns:
  // - kOk: value holds a usable pointer.
  // - kInvalidArgument: bad size or alignment.
  // - kInternalError: the backend could not satisfy the request.
  // Thread safety: thread safe.
  virtual api::Result<void*> Allocate(std::size_t size, std::size_t alignment) = 0;

  // Frees a block returned by Allocate or AllocateRaw of this instance.
  // nullptr is a no-op.
  virtual api::Status Deallocate(void* ptr) = 0;

  // Same contract as Allocate without building a Status: returns NULL on any
  // failure. Used on paths that must not allocate while reporting errors, such
  // as a replaced operator new.
  virtual void* AllocateRaw(std::size_t size, std::size_t alignment) = 0;
  virtual void DeallocateRaw(void* ptr) = 0;
};

}  // namespace memory
}  // namespace autoalloc
