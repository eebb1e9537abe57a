#include "autoalloc/memory/i_global_allocator.hpp"

#include <atomic>
#include <mutex>
#include <new>
#include <type_traits>

#include "memory/backend_registry.hpp"
#include "memory/embedded_heap_allocator.hpp"
#include "memory/secure_native_allocator.hpp"
#include "memory/system_allocator.hpp"
#if defined(AUTOALLOC_ENABLE_MIMALLOC_BACKEND)
#include "memory/mimalloc_allocator.hpp"
#endif
#if defined(AUTOALLOC_ENABLE_TBBMALLOC_BACKEND)
#include "memory/tbb_allocator.hpp"
#endif

namespace autoalloc {
namespace memory {

#define AA_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, (detail))

namespace {

#if defined(AUTOALLOC_ENABLE_MIMALLOC_BACKEND)
typedef MimallocAllocator HighPerformanceBackend;
#elif defined(AUTOALLOC_ENABLE_TBBMALLOC_BACKEND)
typedef TbbAllocator HighPerformanceBackend;
#else
typedef SystemAllocator HighPerformanceBackend;
#endif

#if defined(AUTOALLOC_FORCE_BACKEND)
static_assert(AUTOALLOC_FORCE_BACKEND >= 0 && AUTOALLOC_FORCE_BACKEND < kAllocatorTypeCount,
              "AUTOALLOC_FORCE_BACKEND must name an AllocatorType (0..3)");
#endif

// Backends bound process-wide live in static storage and are never destroyed,
// so deletes issued by late static destructors still find their heap.
template <typename T>
T& BoundInstance() {
  static typename std::aligned_storage<sizeof(T), alignof(T)>::type storage;
  static T* instance = new (&storage) T();
  return *instance;
}

std::once_flag g_bind_once;
std::atomic<bool> g_bound(false);
selection::SelectionDecision g_decision;

void BindOnce() {
  const selection::PlatformProfile profile = selection::ResolveProfile();
  selection::HardwareSnapshot hw;
  if (selection::PolicyConsultsHardware(profile)) {
    hw = selection::CachedHardwareSnapshot();
  }
  selection::SelectionDecision decision = selection::Decide(profile, hw);
#if defined(AUTOALLOC_FORCE_BACKEND)
  decision = selection::ApplyBuildOverride(
      decision, static_cast<AllocatorType>(AUTOALLOC_FORCE_BACKEND), profile);
#endif
  g_decision = decision;
  g_bound.store(true, std::memory_order_release);
}

AllocatorType BoundTypeFast() {
  if (!g_bound.load(std::memory_order_acquire)) {
    GlobalAllocator::Bind();
  }
  return g_decision.chosen;
}

// Calls op on the concrete bound backend. The static type is final, so the
// member call is resolved without a vtable lookup.
template <typename Op>
typename Op::result_type DispatchBound(const Op& op) {
  switch (BoundTypeFast()) {
    case AllocatorType::kHighPerformanceGeneral:
      return op(BoundInstance<HighPerformanceBackend>());
    case AllocatorType::kPlatformSecureNative:
      return op(BoundInstance<SecureNativeAllocator>());
    case AllocatorType::kEmbeddedHeap:
      return op(BoundInstance<EmbeddedHeapAllocator>());
    case AllocatorType::kSystem:
    default:
      return op(BoundInstance<SystemAllocator>());
  }
}

struct AllocateOp {
  typedef api::Result<void*> result_type;
  std::size_t size;
  std::size_t alignment;
  template <typename A>
  result_type operator()(A& a) const { return a.Allocate(size, alignment); }
};

struct DeallocateOp {
  typedef api::Status result_type;
  void* ptr;
  template <typename A>
  result_type operator()(A& a) const { return a.Deallocate(ptr); }
};

struct AllocateRawOp {
  typedef void* result_type;
  std::size_t size;
  std::size_t alignment;
  template <typename A>
  result_type operator()(A& a) const { return a.AllocateRaw(size, alignment); }
};

struct DeallocateRawOp {
  typedef void result_type;
  void* ptr;
  template <typename A>
  result_type operator()(A& a) const { a.DeallocateRaw(ptr); }
};

struct BackendNameOp {
  typedef const char* result_type;
  template <typename A>
  result_type operator()(A& a) const { return a.BackendName(); }
};

struct CapsOp {
  typedef AllocatorCaps result_type;
  template <typename A>
  result_type operator()(A& a) const { return a.Caps(); }
};

struct StatsOp {
  typedef AllocatorStats result_type;
  template <typename A>
  result_type operator()(A& a) const { return a.Stats(); }
};

struct ResetStatsOp {
  typedef void result_type;
  template <typename A>
  result_type operator()(A& a) const { a.ResetStats(); }
};

const char* BackendDisplayNameImpl(AllocatorType type) {
  switch (type) {
    case AllocatorType::kSystem:
      return "system";
    case AllocatorType::kHighPerformanceGeneral:
#if defined(AUTOALLOC_ENABLE_MIMALLOC_BACKEND)
      return "mimalloc";
#elif defined(AUTOALLOC_ENABLE_TBBMALLOC_BACKEND)
      return "tbbmalloc";
#else
      return "unavailable";
#endif
    case AllocatorType::kPlatformSecureNative:
      return SecureNativeBackendName();
    case AllocatorType::kEmbeddedHeap:
      return "embedded-arena";
    default:
      return "unknown";
  }
}

}  // namespace

const char* AllocatorTypeName(AllocatorType type) {
  switch (type) {
    case AllocatorType::kSystem:
      return "System";
    case AllocatorType::kHighPerformanceGeneral:
      return "HighPerformanceGeneral";
    case AllocatorType::kPlatformSecureNative:
      return "PlatformSecureNative";
    case AllocatorType::kEmbeddedHeap:
      return "EmbeddedHeap";
    default:
      return "Unknown";
  }
}

api::Result<IAllocator*> CreateBackend(AllocatorType type) {
  switch (type) {
    case AllocatorType::kSystem:
      return api::Result<IAllocator*>(static_cast<IAllocator*>(new SystemAllocator()));
    case AllocatorType::kHighPerformanceGeneral:
#if defined(AUTOALLOC_ENABLE_MIMALLOC_BACKEND) || defined(AUTOALLOC_ENABLE_TBBMALLOC_BACKEND)
      return api::Result<IAllocator*>(static_cast<IAllocator*>(new HighPerformanceBackend()));
#else
      return api::Result<IAllocator*>(AA_STATUS(api::StatusCode::kUnsupported,
                                                "Requested backend is not enabled in this build",
                                                api::kMemDetailBackendDisabled));
#endif
    case AllocatorType::kPlatformSecureNative:
      return api::Result<IAllocator*>(static_cast<IAllocator*>(new SecureNativeAllocator()));
    case AllocatorType::kEmbeddedHeap:
      return api::Result<IAllocator*>(static_cast<IAllocator*>(new EmbeddedHeapAllocator()));
    default:
      return api::Result<IAllocator*>(AA_STATUS(api::StatusCode::kInvalidArgument,
                                                "unknown allocator type", 0));
  }
}

const selection::SelectionDecision& GlobalAllocator::Bind() {
  if (!g_bound.load(std::memory_order_acquire)) {
    std::call_once(g_bind_once, &BindOnce);
  }
  return g_decision;
}

bool GlobalAllocator::IsBound() { return g_bound.load(std::memory_order_acquire); }

AllocatorType GlobalAllocator::BoundType() { return BoundTypeFast(); }

api::Result<void*> GlobalAllocator::Allocate(std::size_t size, std::size_t alignment) {
  AllocateOp op;
  op.size = size;
  op.alignment = alignment;
  return DispatchBound(op);
}

api::Status GlobalAllocator::Deallocate(void* ptr) {
  if (ptr == NULL) {
    return api::Status::Ok();
  }
  DeallocateOp op;
  op.ptr = ptr;
  return DispatchBound(op);
}

void* GlobalAllocator::AllocateRaw(std::size_t size, std::size_t alignment) {
  AllocateRawOp op;
  op.size = size;
  op.alignment = alignment;
  return DispatchBound(op);
}

void GlobalAllocator::DeallocateRaw(void* ptr) {
  if (ptr == NULL) return;
  DeallocateRawOp op;
  op.ptr = ptr;
  DispatchBound(op);
}

const char* GlobalAllocator::BackendDisplayName(AllocatorType type) {
  return BackendDisplayNameImpl(type);
}

bool GlobalAllocator::IsBackendEnabled(AllocatorType type) {
  return selection::ResolveProfile().available_backends.Contains(type);
}

const char* GlobalAllocator::CurrentBackendName() { return DispatchBound(BackendNameOp()); }

AllocatorCaps GlobalAllocator::CurrentCaps() { return DispatchBound(CapsOp()); }

AllocatorStats GlobalAllocator::CurrentStats() { return DispatchBound(StatsOp()); }

void GlobalAllocator::ResetCurrentStats() { DispatchBound(ResetStatsOp()); }

#undef AA_STATUS

}  // namespace memory
}  // namespace autoalloc
