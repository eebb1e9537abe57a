#include "autoalloc/selection/hardware_snapshot.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

#include "autoalloc/selection/platform_defines.hpp"

#if AUTOALLOC_OS_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif AUTOALLOC_OS_MACOS || AUTOALLOC_OS_IOS || AUTOALLOC_OS_BSD
#include <sys/types.h>
#include <sys/sysctl.h>
#include <unistd.h>
#elif AUTOALLOC_OS_LINUX || AUTOALLOC_OS_ANDROID
#include <sys/sysinfo.h>
#include <unistd.h>
#elif AUTOALLOC_OS_SOLARIS
#include <unistd.h>
#endif

namespace autoalloc {
namespace selection {

namespace {

bool QueryCpuCores(std::uint32_t* out) {
#if AUTOALLOC_OS_WINDOWS
  SYSTEM_INFO info;
  GetSystemInfo(&info);
  *out = static_cast<std::uint32_t>(info.dwNumberOfProcessors);
  return *out > 0;
#elif AUTOALLOC_OS_NO_HEAP || AUTOALLOC_OS_WEB
  (void)out;
  return false;
#elif defined(_SC_NPROCESSORS_ONLN)
  const long cores = sysconf(_SC_NPROCESSORS_ONLN);
  if (cores <= 0) {
    return false;
  }
  *out = static_cast<std::uint32_t>(cores);
  return true;
#else
  (void)out;
  return false;
#endif
}

bool QueryTotalMemory(std::uint64_t* out) {
#if AUTOALLOC_OS_WINDOWS
  MEMORYSTATUSEX status;
  status.dwLength = sizeof(status);
  if (GlobalMemoryStatusEx(&status) == 0) {
    return false;
  }
  *out = static_cast<std::uint64_t>(status.ullTotalPhys);
  return true;
#elif defined(__EMSCRIPTEN__) || defined(__wasm__)
  // Linear memory size in 64 KiB pages.
  *out = static_cast<std::uint64_t>(__builtin_wasm_memory_size(0)) * 65536u;
  return true;
#elif AUTOALLOC_OS_NO_HEAP
  (void)out;
  return false;
#elif AUTOALLOC_OS_LINUX || AUTOALLOC_OS_ANDROID
  struct sysinfo info;
  if (sysinfo(&info) != 0) {
    return false;
  }
  *out = static_cast<std::uint64_t>(info.totalram) * static_cast<std::uint64_t>(info.mem_unit);
  return true;
#elif AUTOALLOC_OS_MACOS || AUTOALLOC_OS_IOS
  int mib[2] = {CTL_HW, HW_MEMSIZE};
  std::uint64_t mem = 0;
  size_t len = sizeof(mem);
  if (sysctl(mib, 2, &mem, &len, NULL, 0) != 0) {
    return false;
  }
  *out = mem;
  return true;
#elif AUTOALLOC_OS_BSD && defined(HW_PHYSMEM64)
  int mib[2] = {CTL_HW, HW_PHYSMEM64};
  std::uint64_t mem = 0;
  size_t len = sizeof(mem);
  if (sysctl(mib, 2, &mem, &len, NULL, 0) != 0) {
    return false;
  }
  *out = mem;
  return true;
#elif AUTOALLOC_OS_BSD
  int mib[2] = {CTL_HW, HW_PHYSMEM};
  unsigned long mem = 0;
  size_t len = sizeof(mem);
  if (sysctl(mib, 2, &mem, &len, NULL, 0) != 0) {
    return false;
  }
  *out = static_cast<std::uint64_t>(mem);
  return true;
#elif defined(_SC_PHYS_PAGES) && defined(_SC_PAGESIZE)
  const long pages = sysconf(_SC_PHYS_PAGES);
  const long page_size = sysconf(_SC_PAGESIZE);
  if (pages <= 0 || page_size <= 0) {
    return false;
  }
  *out = static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page_size);
  return true;
#else
  (void)out;
  return false;
#endif
}

std::once_flag g_probe_once;
std::atomic<bool> g_probed(false);
std::atomic<std::uint64_t> g_probe_invocations(0);
HardwareSnapshot g_snapshot;

// Guards the query table until the probe has consumed it.
std::mutex g_queries_mu;
bool g_queries_custom = false;
bool g_queries_consumed = false;
HardwareQueries g_queries;

HardwareQueries TakeQueries() {
  std::lock_guard<std::mutex> lock(g_queries_mu);
  g_queries_consumed = true;
  return g_queries_custom ? g_queries : DefaultHardwareQueries();
}

void ProbeOnce() {
  g_probe_invocations.fetch_add(1, std::memory_order_relaxed);
  g_snapshot = ProbeHardwareWith(TakeQueries());
  g_probed.store(true, std::memory_order_release);
}

}  // namespace

HardwareQueries DefaultHardwareQueries() {
  HardwareQueries queries;
  queries.cpu_cores = &QueryCpuCores;
  queries.total_memory_bytes = &QueryTotalMemory;
  return queries;
}

HardwareSnapshot ProbeHardwareWith(const HardwareQueries& queries) {
  HardwareSnapshot snapshot;

  std::uint32_t cores = 0;
  if (queries.cpu_cores != NULL && queries.cpu_cores(&cores) && cores > 0) {
    snapshot.cpu_cores = cores;
  } else {
    snapshot.cpu_cores = 1;
    snapshot.probe_degraded = true;
  }

  std::uint64_t memory = 0;
  if (queries.total_memory_bytes != NULL && queries.total_memory_bytes(&memory)) {
    snapshot.total_memory_bytes = memory;
  } else {
    snapshot.total_memory_bytes = 0;
    snapshot.probe_degraded = true;
  }
  return snapshot;
}

const HardwareSnapshot& CachedHardwareSnapshot() {
  if (!g_probed.load(std::memory_order_acquire)) {
    std::call_once(g_probe_once, &ProbeOnce);
  }
  return g_snapshot;
}

api::Status SetHardwareQueries(const HardwareQueries& queries) {
  std::lock_guard<std::mutex> lock(g_queries_mu);
  if (g_queries_consumed) {
    return api::Status::FromModule(api::StatusCode::kAlreadyInitialized,
                                   "hardware snapshot already probed",
                                   api::ErrorModule::kSelection, api::kSelDetailProbeAlreadyRun);
  }
  g_queries = queries;
  g_queries_custom = true;
  return api::Status::Ok();
}

std::uint64_t HardwareProbeInvocations() {
  return g_probe_invocations.load(std::memory_order_acquire);
}

std::size_t FormatMemorySizeTo(std::uint64_t bytes, char* buf, std::size_t capacity) {
  static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  if (buf == NULL || capacity == 0) {
    return 0;
  }

  int unit = 0;
  if (bytes >= (1ull << 50)) {
    unit = 5;
  } else if (bytes >= (1ull << 40)) {
    unit = 4;
  } else if (bytes >= (1ull << 30)) {
    unit = 3;
  } else if (bytes >= (1ull << 20)) {
    unit = 2;
  } else if (bytes >= (1ull << 10)) {
    unit = 1;
  }

  int written = 0;
  if (unit == 0) {
    written = std::snprintf(buf, capacity, "%lluB", static_cast<unsigned long long>(bytes));
  } else {
    const unsigned shift = static_cast<unsigned>(unit) * 10u;
    const std::uint64_t value = bytes >> shift;
    const std::uint64_t remainder = bytes & ((1ull << shift) - 1);
    // Truncated, one decimal; remainder * 10 stays below 2^54.
    const std::uint64_t fraction = (remainder * 10u) >> shift;
    if (fraction == 0) {
      written = std::snprintf(buf, capacity, "%llu%s", static_cast<unsigned long long>(value),
                              kUnits[unit]);
    } else {
      written = std::snprintf(buf, capacity, "%llu.%llu%s",
                              static_cast<unsigned long long>(value),
                              static_cast<unsigned long long>(fraction), kUnits[unit]);
    }
  }
  if (written < 0) {
    buf[0] = '\0';
    return 0;
  }
  const std::size_t len = static_cast<std::size_t>(written);
  return len < capacity ? len : capacity - 1;
}

}  // namespace selection
}  // namespace autoalloc
