#include "autoalloc/autoalloc.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

using autoalloc::selection::HardwareQueries;

namespace {

bool FailCores(std::uint32_t*) { return false; }
bool FailMemory(std::uint64_t*) { return false; }

bool g_queries_installed = false;

}  // namespace

// Must run first: nothing may bind or probe before the queries are in place.
bool TestFailingQueriesInstalledBeforeFirstProbe() {
  if (autoalloc::selection::HardwareProbeInvocations() != 0) return false;
  if (autoalloc::memory::GlobalAllocator::IsBound()) return false;

  HardwareQueries queries;
  queries.cpu_cores = &FailCores;
  queries.total_memory_bytes = &FailMemory;
  const autoalloc::api::Status st = autoalloc::selection::SetHardwareQueries(queries);
  g_queries_installed = st.ok();
  return g_queries_installed;
}

bool TestInfoReasonCarriesDegradedMarker() {
  if (!g_queries_installed) return false;
  const autoalloc::selection::AllocatorInfo& info = autoalloc::selection::GetAllocatorInfo();
  if (info.system_info.cpu_cores != 1 || info.system_info.total_memory_bytes != 0) return false;
  if (!autoalloc::selection::CachedHardwareSnapshot().probe_degraded) return false;
  return info.reason.find("probe degraded") != std::string::npos &&
         info.reason.find("defaults assumed") != std::string::npos;
}

bool TestRecommendationAgreesOnDegradedMarker() {
  const autoalloc::selection::Recommendation rec = autoalloc::selection::GetRecommendedAllocator();
  return rec.reason.find("probe degraded") != std::string::npos;
}

bool TestQueriesLockedAfterProbe() {
  HardwareQueries queries = autoalloc::selection::DefaultHardwareQueries();
  const autoalloc::api::Status st = autoalloc::selection::SetHardwareQueries(queries);
  if (st.ok() || st.code() != autoalloc::api::StatusCode::kAlreadyInitialized) return false;
  if (st.hex_code() != autoalloc::api::MakeErrorCode(autoalloc::api::ErrorModule::kSelection,
                                                     autoalloc::api::StatusCode::kAlreadyInitialized,
                                                     autoalloc::api::kSelDetailProbeAlreadyRun)) {
    return false;
  }
  // The snapshot taken with the failing queries stays.
  return autoalloc::selection::HardwareProbeInvocations() == 1 &&
         autoalloc::selection::CachedHardwareSnapshot().probe_degraded;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"failing_queries_installed_before_first_probe", TestFailingQueriesInstalledBeforeFirstProbe},
      {"info_reason_carries_degraded_marker", TestInfoReasonCarriesDegradedMarker},
      {"recommendation_agrees_on_degraded_marker", TestRecommendationAgreesOnDegradedMarker},
      {"queries_locked_after_probe", TestQueriesLockedAfterProbe},
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
