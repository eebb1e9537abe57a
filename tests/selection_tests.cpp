#include "autoalloc/autoalloc.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

using autoalloc::memory::AllocatorType;
using autoalloc::selection::BuildMode;
using autoalloc::selection::Decide;
using autoalloc::selection::HardwareSnapshot;
using autoalloc::selection::MobilePolicy;
using autoalloc::selection::OsFamily;
using autoalloc::selection::PlatformProfile;
using autoalloc::selection::PolicyOptions;
using autoalloc::selection::RuleId;
using autoalloc::selection::SelectionDecision;

namespace {

PlatformProfile DesktopRelease() {
  PlatformProfile p;
  p.os_family = OsFamily::kDesktop;
  p.os = "linux";
  p.arch = "x86_64";
  p.build_mode = BuildMode::kRelease;
  p.available_backends.Insert(AllocatorType::kSystem);
  p.available_backends.Insert(AllocatorType::kHighPerformanceGeneral);
  return p;
}

HardwareSnapshot Hw(std::uint32_t cores, std::uint64_t memory) {
  HardwareSnapshot hw;
  hw.cpu_cores = cores;
  hw.total_memory_bytes = memory;
  hw.probe_degraded = false;
  return hw;
}

PolicyOptions Options(std::uint32_t threshold, MobilePolicy mobile) {
  PolicyOptions o;
  o.core_threshold = threshold;
  o.mobile_policy = mobile;
  return o;
}

bool Contains(const char* haystack, const char* needle) {
  return std::strstr(haystack, needle) != NULL;
}

bool IsKnownType(AllocatorType t) {
  return t == AllocatorType::kSystem || t == AllocatorType::kHighPerformanceGeneral ||
         t == AllocatorType::kPlatformSecureNative || t == AllocatorType::kEmbeddedHeap;
}

}  // namespace

bool TestRuleIdNames() {
  return std::string(autoalloc::selection::RuleIdName(RuleId::kNoHeapOs)) == "no-heap-os" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kDebugBuild)) == "debug-build" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kWasm)) == "wasm" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kMobile)) == "mobile" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kNativeTuned)) == "native-tuned" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kDesktopRelease)) ==
             "desktop-release" &&
         std::string(autoalloc::selection::RuleIdName(RuleId::kBuildOverride)) == "build-override";
}

bool TestTotalityOverProfileGrid() {
  const OsFamily families[] = {OsFamily::kDesktop, OsFamily::kMobile,  OsFamily::kBsdLike,
                               OsFamily::kSolarisLike, OsFamily::kWeb, OsFamily::kEmbedded,
                               OsFamily::kUnknown};
  const std::uint32_t cores[] = {1, 2, 3, 64};
  const std::uint64_t memories[] = {0, 512, 1ull << 34};

  for (std::size_t f = 0; f < sizeof(families) / sizeof(families[0]); ++f) {
    for (int mask = 0; mask < 64; ++mask) {
      PlatformProfile p;
      p.os_family = families[f];
      p.build_mode = (mask & 1) ? BuildMode::kRelease : BuildMode::kDebug;
      p.is_wasm = (mask & 2) != 0;
      p.is_no_heap_os = (mask & 4) != 0;
      p.secure_mode = (mask & 8) != 0;
      p.available_backends.Insert(AllocatorType::kSystem);
      if (mask & 16) p.available_backends.Insert(AllocatorType::kHighPerformanceGeneral);
      if (mask & 32) p.available_backends.Insert(AllocatorType::kPlatformSecureNative);

      for (std::size_t c = 0; c < sizeof(cores) / sizeof(cores[0]); ++c) {
        for (std::size_t m = 0; m < sizeof(memories) / sizeof(memories[0]); ++m) {
          const SelectionDecision d = Decide(p, Hw(cores[c], memories[m]));
          if (!IsKnownType(d.chosen)) return false;
          if (std::strlen(d.reason) == 0) return false;
          if (d.chosen != AllocatorType::kEmbeddedHeap && d.chosen != AllocatorType::kSystem &&
              !p.available_backends.Contains(d.chosen)) {
            return false;
          }
        }
      }
    }
  }
  return true;
}

bool TestDeterminism() {
  const PlatformProfile p = DesktopRelease();
  const HardwareSnapshot hw = Hw(8, 16ull << 30);
  const SelectionDecision a = Decide(p, hw);
  const SelectionDecision b = Decide(p, hw);
  return a.chosen == b.chosen && a.rule_id == b.rule_id &&
         std::memcmp(a.reason, b.reason, sizeof(a.reason)) == 0;
}

bool TestNoHeapOsWinsAbsolutely() {
  PlatformProfile p = DesktopRelease();
  p.is_no_heap_os = true;
  p.is_wasm = true;
  p.os_family = OsFamily::kMobile;
  const BuildMode modes[] = {BuildMode::kDebug, BuildMode::kRelease};
  for (int i = 0; i < 2; ++i) {
    p.build_mode = modes[i];
    const SelectionDecision d = Decide(p, Hw(64, 1ull << 40));
    if (d.chosen != AllocatorType::kEmbeddedHeap) return false;
    if (d.rule_id != RuleId::kNoHeapOs) return false;
  }
  return true;
}

bool TestDebugWinsOverHardware() {
  PlatformProfile p = DesktopRelease();
  p.build_mode = BuildMode::kDebug;
  const SelectionDecision d = Decide(p, Hw(64, 64ull << 30));
  return d.chosen == AllocatorType::kSystem && d.rule_id == RuleId::kDebugBuild;
}

bool TestWasmYieldsSystem() {
  PlatformProfile p = DesktopRelease();
  p.os_family = OsFamily::kWeb;
  p.is_wasm = true;
  const SelectionDecision d = Decide(p, Hw(8, 1ull << 30));
  return d.chosen == AllocatorType::kSystem && d.rule_id == RuleId::kWasm;
}

bool TestThresholdBoundary() {
  const PlatformProfile p = DesktopRelease();
  const PolicyOptions defaults = autoalloc::selection::DefaultPolicyOptions();
  const std::uint32_t threshold = defaults.core_threshold;

  if (threshold > 1) {
    const SelectionDecision below = Decide(p, Hw(threshold - 1, 8ull << 30), defaults);
    if (below.chosen != AllocatorType::kSystem) return false;
    if (below.rule_id != RuleId::kDesktopRelease) return false;
  }
  const SelectionDecision at = Decide(p, Hw(threshold, 8ull << 30), defaults);
  if (at.chosen != AllocatorType::kHighPerformanceGeneral) return false;

  const PolicyOptions four = Options(4, MobilePolicy::kPreferSecureNative);
  return Decide(p, Hw(3, 0), four).chosen == AllocatorType::kSystem &&
         Decide(p, Hw(4, 0), four).chosen == AllocatorType::kHighPerformanceGeneral;
}

bool TestHighPerformanceUnavailableFallsBackToSystem() {
  PlatformProfile p = DesktopRelease();
  p.available_backends.Erase(AllocatorType::kHighPerformanceGeneral);
  const SelectionDecision d = Decide(p, Hw(32, 32ull << 30));
  return d.chosen == AllocatorType::kSystem && d.rule_id == RuleId::kDesktopRelease &&
         Contains(d.reason, "not compiled in");
}

bool TestMobileHonoursPolicyAndAvailability() {
  PlatformProfile p = DesktopRelease();
  p.os_family = OsFamily::kMobile;
  p.os = "android";

  const PolicyOptions secure = Options(2, MobilePolicy::kPreferSecureNative);
  const PolicyOptions system = Options(2, MobilePolicy::kSystem);

  if (Decide(p, Hw(8, 4ull << 30), secure).chosen != AllocatorType::kSystem) return false;

  p.available_backends.Insert(AllocatorType::kPlatformSecureNative);
  const SelectionDecision hardened = Decide(p, Hw(8, 4ull << 30), secure);
  if (hardened.chosen != AllocatorType::kPlatformSecureNative) return false;
  if (hardened.rule_id != RuleId::kMobile) return false;

  const SelectionDecision plain = Decide(p, Hw(8, 4ull << 30), system);
  return plain.chosen == AllocatorType::kSystem && plain.rule_id == RuleId::kMobile;
}

bool TestBsdAndSolarisYieldSystem() {
  PlatformProfile p = DesktopRelease();
  p.os_family = OsFamily::kBsdLike;
  const SelectionDecision bsd = Decide(p, Hw(64, 1ull << 36));
  p.os_family = OsFamily::kSolarisLike;
  const SelectionDecision sol = Decide(p, Hw(64, 1ull << 36));
  return bsd.chosen == AllocatorType::kSystem && bsd.rule_id == RuleId::kNativeTuned &&
         sol.chosen == AllocatorType::kSystem && sol.rule_id == RuleId::kNativeTuned;
}

bool TestSecureModeSubstitution() {
  PlatformProfile p = DesktopRelease();
  p.secure_mode = true;
  p.available_backends.Insert(AllocatorType::kPlatformSecureNative);
  const SelectionDecision multi = Decide(p, Hw(8, 8ull << 30));
  if (multi.chosen != AllocatorType::kPlatformSecureNative) return false;
  if (multi.rule_id != RuleId::kDesktopRelease) return false;
  const SelectionDecision single = Decide(p, Hw(1, 8ull << 30));
  return single.chosen == AllocatorType::kSystem;
}

bool TestReasonContents() {
  PlatformProfile p = DesktopRelease();
  const SelectionDecision hw_rule = Decide(p, Hw(8, 16ull << 30), Options(2, MobilePolicy::kSystem));
  if (!Contains(hw_rule.reason, "desktop-release")) return false;
  if (!Contains(hw_rule.reason, "8 cores")) return false;
  if (!Contains(hw_rule.reason, "threshold 2")) return false;
  if (!Contains(hw_rule.reason, "16GB")) return false;
  if (!Contains(hw_rule.reason, "HighPerformanceGeneral")) return false;
  if (Contains(hw_rule.reason, "degraded")) return false;

  p.build_mode = BuildMode::kDebug;
  const SelectionDecision debug = Decide(p, Hw(8, 16ull << 30));
  return Contains(debug.reason, "debug-build") && Contains(debug.reason, "hardware not consulted");
}

bool TestDegradedMarkerInReason() {
  const PlatformProfile p = DesktopRelease();
  HardwareSnapshot hw = Hw(1, 0);
  hw.probe_degraded = true;
  const SelectionDecision d = Decide(p, hw);
  return d.chosen == AllocatorType::kSystem && Contains(d.reason, "probe degraded");
}

bool TestPolicyConsultsHardware() {
  PlatformProfile p = DesktopRelease();
  if (!autoalloc::selection::PolicyConsultsHardware(p)) return false;
  p.os_family = OsFamily::kBsdLike;
  if (autoalloc::selection::PolicyConsultsHardware(p)) return false;
  p = DesktopRelease();
  p.build_mode = BuildMode::kDebug;
  if (autoalloc::selection::PolicyConsultsHardware(p)) return false;
  p = DesktopRelease();
  p.is_no_heap_os = true;
  return !autoalloc::selection::PolicyConsultsHardware(p);
}

bool TestBuildOverride() {
  const PlatformProfile p = DesktopRelease();
  const SelectionDecision policy = Decide(p, Hw(8, 8ull << 30));

  const SelectionDecision pinned =
      autoalloc::selection::ApplyBuildOverride(policy, AllocatorType::kSystem, p);
  if (pinned.chosen != AllocatorType::kSystem) return false;
  if (pinned.rule_id != RuleId::kBuildOverride) return false;
  if (!Contains(pinned.reason, "build-override")) return false;
  if (!Contains(pinned.reason, "desktop-release")) return false;

  const SelectionDecision ignored =
      autoalloc::selection::ApplyBuildOverride(policy, AllocatorType::kEmbeddedHeap, p);
  return ignored.chosen == policy.chosen && ignored.rule_id == policy.rule_id &&
         Contains(ignored.reason, "ignored");
}

bool TestProbeStateAddedAfterShortCircuit() {
  PlatformProfile p = DesktopRelease();
  p.is_no_heap_os = true;
  HardwareSnapshot degraded = Hw(1, 0);
  degraded.probe_degraded = true;

  const SelectionDecision bound = Decide(p, Hw(1, 0));
  if (Contains(bound.reason, "probe degraded")) return false;

  const SelectionDecision marked = autoalloc::selection::WithProbeState(bound, degraded);
  if (marked.chosen != bound.chosen || marked.rule_id != bound.rule_id) return false;
  if (std::strcmp(marked.reason, Decide(p, degraded).reason) != 0) return false;

  const SelectionDecision twice = autoalloc::selection::WithProbeState(marked, degraded);
  if (std::strcmp(twice.reason, marked.reason) != 0) return false;

  const SelectionDecision healthy = autoalloc::selection::WithProbeState(bound, Hw(4, 1ull << 30));
  if (std::strcmp(healthy.reason, bound.reason) != 0) return false;

  const SelectionDecision pinned = autoalloc::selection::WithProbeState(
      autoalloc::selection::ApplyBuildOverride(bound, AllocatorType::kSystem, DesktopRelease()),
      degraded);
  return Contains(pinned.reason, "build-override") && Contains(pinned.reason, "probe degraded");
}

bool TestResolveProfileIsStable() {
  const PlatformProfile a = autoalloc::selection::ResolveProfile();
  const PlatformProfile b = autoalloc::selection::ResolveProfile();
  if (a.os_family != b.os_family || a.build_mode != b.build_mode) return false;
  if (std::strcmp(a.os, b.os) != 0 || std::strcmp(a.arch, b.arch) != 0) return false;
  return a.available_backends.Contains(AllocatorType::kSystem);
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"rule_id_names", TestRuleIdNames},
      {"totality_over_profile_grid", TestTotalityOverProfileGrid},
      {"determinism", TestDeterminism},
      {"no_heap_os_wins_absolutely", TestNoHeapOsWinsAbsolutely},
      {"debug_wins_over_hardware", TestDebugWinsOverHardware},
      {"wasm_yields_system", TestWasmYieldsSystem},
      {"threshold_boundary", TestThresholdBoundary},
      {"high_performance_unavailable", TestHighPerformanceUnavailableFallsBackToSystem},
      {"mobile_policy_and_availability", TestMobileHonoursPolicyAndAvailability},
      {"bsd_and_solaris_yield_system", TestBsdAndSolarisYieldSystem},
      {"secure_mode_substitution", TestSecureModeSubstitution},
      {"reason_contents", TestReasonContents},
      {"degraded_marker_in_reason", TestDegradedMarkerInReason},
      {"policy_consults_hardware", TestPolicyConsultsHardware},
      {"build_override", TestBuildOverride},
      {"probe_state_added_after_short_circuit", TestProbeStateAddedAfterShortCircuit},
      {"resolve_profile_is_stable", TestResolveProfileIsStable},
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
