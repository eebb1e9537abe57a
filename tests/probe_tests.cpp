#include "autoalloc/autoalloc.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

using autoalloc::memory::AllocatorType;
using autoalloc::selection::HardwareQueries;
using autoalloc::selection::HardwareSnapshot;

namespace {

bool FailCores(std::uint32_t*) { return false; }
bool FailMemory(std::uint64_t*) { return false; }

bool ZeroCores(std::uint32_t* out) {
  *out = 0;
  return true;
}

bool SixCores(std::uint32_t* out) {
  *out = 6;
  return true;
}

bool EightGigabytes(std::uint64_t* out) {
  *out = 8ull << 30;
  return true;
}

HardwareQueries Queries(bool (*cores)(std::uint32_t*), bool (*memory)(std::uint64_t*)) {
  HardwareQueries q;
  q.cpu_cores = cores;
  q.total_memory_bytes = memory;
  return q;
}

autoalloc::selection::PlatformProfile DesktopRelease() {
  autoalloc::selection::PlatformProfile p;
  p.os_family = autoalloc::selection::OsFamily::kDesktop;
  p.build_mode = autoalloc::selection::BuildMode::kRelease;
  p.available_backends.Insert(AllocatorType::kSystem);
  p.available_backends.Insert(AllocatorType::kHighPerformanceGeneral);
  return p;
}

}  // namespace

bool TestHealthyQueries() {
  const HardwareSnapshot hw =
      autoalloc::selection::ProbeHardwareWith(Queries(SixCores, EightGigabytes));
  return hw.cpu_cores == 6 && hw.total_memory_bytes == (8ull << 30) && !hw.probe_degraded;
}

bool TestFailingQueriesDegrade() {
  const HardwareSnapshot hw = autoalloc::selection::ProbeHardwareWith(Queries(FailCores, FailMemory));
  if (!hw.probe_degraded || hw.cpu_cores != 1 || hw.total_memory_bytes != 0) return false;

  const autoalloc::selection::SelectionDecision d =
      autoalloc::selection::Decide(DesktopRelease(), hw);
  return d.chosen == AllocatorType::kSystem && std::strstr(d.reason, "probe degraded") != NULL;
}

bool TestSingleFailingQueryDegrades() {
  const HardwareSnapshot no_memory =
      autoalloc::selection::ProbeHardwareWith(Queries(SixCores, FailMemory));
  if (!no_memory.probe_degraded || no_memory.cpu_cores != 6 || no_memory.total_memory_bytes != 0) {
    return false;
  }
  const HardwareSnapshot no_cores =
      autoalloc::selection::ProbeHardwareWith(Queries(FailCores, EightGigabytes));
  return no_cores.probe_degraded && no_cores.cpu_cores == 1 &&
         no_cores.total_memory_bytes == (8ull << 30);
}

bool TestZeroCoresCountsAsFailure() {
  const HardwareSnapshot hw = autoalloc::selection::ProbeHardwareWith(Queries(ZeroCores, EightGigabytes));
  return hw.probe_degraded && hw.cpu_cores == 1;
}

bool TestMissingQueriesDegrade() {
  const HardwareSnapshot hw = autoalloc::selection::ProbeHardwareWith(Queries(NULL, NULL));
  return hw.probe_degraded && hw.cpu_cores == 1 && hw.total_memory_bytes == 0;
}

bool TestDefaultQueriesOnHost() {
  const HardwareSnapshot hw =
      autoalloc::selection::ProbeHardwareWith(autoalloc::selection::DefaultHardwareQueries());
  return hw.cpu_cores >= 1;
}

bool TestCachedSnapshotProbesOnce() {
  const HardwareSnapshot& a = autoalloc::selection::CachedHardwareSnapshot();
  const HardwareSnapshot& b = autoalloc::selection::CachedHardwareSnapshot();
  return &a == &b && a.cpu_cores >= 1 && autoalloc::selection::HardwareProbeInvocations() == 1;
}

bool TestFormatMemorySizeTo() {
  char buf[32];
  std::size_t len = autoalloc::selection::FormatMemorySizeTo(1536, buf, sizeof(buf));
  if (len != 5 || std::string(buf) != "1.5KB") return false;

  char tiny[4];
  len = autoalloc::selection::FormatMemorySizeTo(1536, tiny, sizeof(tiny));
  if (len != 3 || std::string(tiny) != "1.5") return false;

  return autoalloc::selection::FormatMemorySizeTo(1, NULL, 0) == 0;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"healthy_queries", TestHealthyQueries},
      {"failing_queries_degrade", TestFailingQueriesDegrade},
      {"single_failing_query_degrades", TestSingleFailingQueryDegrades},
      {"zero_cores_counts_as_failure", TestZeroCoresCountsAsFailure},
      {"missing_queries_degrade", TestMissingQueriesDegrade},
      {"default_queries_on_host", TestDefaultQueriesOnHost},
      {"cached_snapshot_probes_once", TestCachedSnapshotProbesOnce},
      {"format_memory_size_to", TestFormatMemorySizeTo},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
