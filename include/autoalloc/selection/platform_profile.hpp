#pragma once

#include <cstdint>

#include "autoalloc/api/export.hpp"
#include "autoalloc/memory/iallocator.hpp"

namespace autoalloc {
namespace selection {

enum class OsFamily { kDesktop, kMobile, kBsdLike, kSolarisLike, kWeb, kEmbedded, kUnknown };

enum class BuildMode { kDebug, kRelease };

AUTOALLOC_API const char* OsFamilyName(OsFamily family);

// Fixed-size set of backend kinds; a bitmask so it never touches the heap.
class BackendSet {
 public:
  BackendSet() : bits_(0) {}

  void Insert(memory::AllocatorType type) { bits_ |= Bit(type); }
  void Erase(memory::AllocatorType type) { bits_ &= ~Bit(type); }
  bool Contains(memory::AllocatorType type) const { return (bits_ & Bit(type)) != 0; }
  bool Empty() const { return bits_ == 0; }

 private:
  static std::uint32_t Bit(memory::AllocatorType type) {
    return 1u << static_cast<std::uint32_t>(type);
  }

  std::uint32_t bits_;
};

// Build-time facts about the target. Holds only scalars and static strings.
struct PlatformProfile {
  OsFamily os_family = OsFamily::kUnknown;
  const char* os = "unknown";
  const char* arch = "unknown";
  BuildMode build_mode = BuildMode::kDebug;
  bool is_wasm = false;
  bool is_no_heap_os = false;
  bool secure_mode = false;
  BackendSet available_backends;
};

// Profile of the target this library was compiled for. Pure and
// allocation-free; the same answer on every call.
AUTOALLOC_API PlatformProfile ResolveProfile();

}  // namespace selection
}  // namespace autoalloc
