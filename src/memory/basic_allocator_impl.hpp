#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "autoalloc/memory/iallocator.hpp"

namespace autoalloc {
namespace memory {

inline bool IsPowerOfTwo(std::size_t x) { return x != 0 && (x & (x - 1)) == 0; }

inline bool IsValidAlignment(std::size_t alignment) {
  return alignment >= sizeof(void*) && IsPowerOfTwo(alignment);
}

// Lock-free allocation counters. Never allocates, so it is usable from a
// replaced operator new.
class AllocatorCounters {
 public:
  AllocatorCounters()
      : alloc_count_(0), free_count_(0), alloc_fail_count_(0), bytes_in_use_(0), bytes_peak_(0) {}

  void RecordAllocFailure() { alloc_fail_count_.fetch_add(1, std::memory_order_relaxed); }

  void RecordAllocSuccess(std::uint64_t bytes) {
    alloc_count_.fetch_add(1, std::memory_order_relaxed);
    const std::uint64_t in_use_now =
        bytes_in_use_.fetch_add(bytes, std::memory_order_relaxed) + bytes;

    std::uint64_t peak = bytes_peak_.load(std::memory_order_relaxed);
    while (in_use_now > peak &&
           !bytes_peak_.compare_exchange_weak(peak, in_use_now, std::memory_order_relaxed,
                                              std::memory_order_relaxed)) {
    }
  }

  void RecordDeallocate(std::uint64_t bytes) {
    free_count_.fetch_add(1, std::memory_order_relaxed);
    if (bytes == 0) return;
    std::uint64_t cur = bytes_in_use_.load(std::memory_order_relaxed);
    while (true) {
      const std::uint64_t next = cur > bytes ? (cur - bytes) : 0;
      if (bytes_in_use_.compare_exchange_weak(cur, next, std::memory_order_relaxed,
                                              std::memory_order_relaxed)) {
        break;
      }
    }
  }

  AllocatorStats Snapshot() const {
    AllocatorStats s;
    s.alloc_count = alloc_count_.load(std::memory_order_relaxed);
    s.free_count = free_count_.load(std::memory_order_relaxed);
    s.alloc_fail_count = alloc_fail_count_.load(std::memory_order_relaxed);
    s.bytes_in_use = bytes_in_use_.load(std::memory_order_relaxed);
    s.bytes_peak = bytes_peak_.load(std::memory_order_relaxed);
    return s;
  }

  void Reset() {
    const std::uint64_t live = bytes_in_use_.load(std::memory_order_relaxed);
    alloc_count_.store(0, std::memory_order_relaxed);
    free_count_.store(0, std::memory_order_relaxed);
    alloc_fail_count_.store(0, std::memory_order_relaxed);
    bytes_peak_.store(live, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> alloc_count_;
  std::atomic<std::uint64_t> free_count_;
  std::atomic<std::uint64_t> alloc_fail_count_;
  std::atomic<std::uint64_t> bytes_in_use_;
  std::atomic<std::uint64_t> bytes_peak_;
};

// Shared IAllocator plumbing. Backend supplies:
//   void* BackendAllocate(std::size_t size, std::size_t alignment);
//   void BackendFree(void* ptr);
//   std::size_t BackendUsableSize(void* ptr) const;   // 0 when unknown
//   static const char* AllocFunctionName();
// The calls are static (CRTP), so a caller holding the concrete final type
// pays no virtual dispatch per allocation.
template <typename Backend>
class BasicAllocator : public IAllocator {
 public:
  std::uint32_t ApiVersion() const override { return api::kApiVersion; }

  AllocatorStats Stats() const override { return counters_.Snapshot(); }

  void ResetStats() override { counters_.Reset(); }

  api::Result<void*> Allocate(std::size_t size, std::size_t alignment) override {
    if (size == 0) {
      counters_.RecordAllocFailure();
      return api::Result<void*>(api::Status::FromModule(
          api::StatusCode::kInvalidArgument, "size must be > 0", api::ErrorModule::kMemory,
          api::kMemDetailInvalidSize));
    }
    if (!IsValidAlignment(alignment)) {
      counters_.RecordAllocFailure();
      return api::Result<void*>(api::Status::FromModule(
          api::StatusCode::kInvalidArgument, "alignment must be power-of-two and >= sizeof(void*)",
          api::ErrorModule::kMemory, api::kMemDetailInvalidAlignment));
    }
    void* ptr = AllocateChecked(size, alignment);
    if (ptr == NULL) {
      return api::Result<void*>(api::Status::FromModule(
          api::StatusCode::kInternalError, std::string(Backend::AllocFunctionName()) + " failed",
          api::ErrorModule::kMemory, api::kMemDetailBackendExhausted));
    }
    return api::Result<void*>(ptr);
  }

  api::Status Deallocate(void* ptr) override {
    DeallocateRaw(ptr);
    return api::Status::Ok();
  }

  void* AllocateRaw(std::size_t size, std::size_t alignment) override {
    if (size == 0 || !IsValidAlignment(alignment)) {
      counters_.RecordAllocFailure();
      return NULL;
    }
    return AllocateChecked(size, alignment);
  }

  void DeallocateRaw(void* ptr) override {
    if (ptr == NULL) return;
    Backend& self = static_cast<Backend&>(*this);
    counters_.RecordDeallocate(static_cast<std::uint64_t>(self.BackendUsableSize(ptr)));
    self.BackendFree(ptr);
  }

 private:
  void* AllocateChecked(std::size_t size, std::size_t alignment) {
    Backend& self = static_cast<Backend&>(*this);
    void* ptr = self.BackendAllocate(size, alignment);
    if (ptr == NULL) {
      counters_.RecordAllocFailure();
      return NULL;
    }
    counters_.RecordAllocSuccess(static_cast<std::uint64_t>(self.BackendUsableSize(ptr)));
    return ptr;
  }

  AllocatorCounters counters_;
};

}  // namespace memory
}  // namespace autoalloc
