#pragma once

#include <cstddef>
#include <cstdint>

#include "autoalloc/api/export.hpp"
#include "autoalloc/api/status.hpp"

namespace autoalloc {
namespace selection {

struct HardwareSnapshot {
  std::uint32_t cpu_cores = 1;
  std::uint64_t total_memory_bytes = 0;
  bool probe_degraded = false;
};

// Environment queries behind the probe. Each returns false when the value
// cannot be obtained. A NULL entry counts as a failed query.
struct HardwareQueries {
  bool (*cpu_cores)(std::uint32_t* out);
  bool (*total_memory_bytes)(std::uint64_t* out);
};

// Queries for the platform this library was compiled for. None allocates.
AUTOALLOC_API HardwareQueries DefaultHardwareQueries();

// Runs the queries once. A failing query, or one reporting 0 cores, is
// replaced by the conservative default (1 core, 0 bytes) and marks the
// snapshot degraded. Never fails.
AUTOALLOC_API HardwareSnapshot ProbeHardwareWith(const HardwareQueries& queries);

// Process-wide snapshot from DefaultHardwareQueries(). Probed on first call
// only; every later call returns the same object without touching the
// environment. Thread safe, allocation-free.
AUTOALLOC_API const HardwareSnapshot& CachedHardwareSnapshot();

// Replaces the queries CachedHardwareSnapshot() runs. Must be called before
// the first probe, i.e. before anything binds the global allocator or reads
// allocator info.
// Returns:
// - kOk: the next cached probe uses queries.
// - kAlreadyInitialized: the snapshot is already taken; nothing changes.
// Thread safety: thread safe.
AUTOALLOC_API api::Status SetHardwareQueries(const HardwareQueries& queries);

// Number of times the cached snapshot queried the environment.
AUTOALLOC_API std::uint64_t HardwareProbeInvocations();

// Writes a human readable size ("0B", "512B", "1.5KB", "16GB") into buf and
// returns the length, truncating to capacity - 1. Allocation-free.
AUTOALLOC_API std::size_t FormatMemorySizeTo(std::uint64_t bytes, char* buf, std::size_t capacity);

}  // namespace selection
}  // namespace autoalloc
