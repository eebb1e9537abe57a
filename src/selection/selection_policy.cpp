#include "autoalloc/selection/selection_policy.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace autoalloc {
namespace selection {

namespace {

#if defined(AUTOALLOC_CORE_THRESHOLD)
static const std::uint32_t kBuildCoreThreshold = AUTOALLOC_CORE_THRESHOLD;
#else
static const std::uint32_t kBuildCoreThreshold = 2;
#endif

void SetReason(SelectionDecision* decision, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  const int written = std::vsnprintf(decision->reason, sizeof(decision->reason), fmt, args);
  va_end(args);
  if (written < 0) {
    decision->reason[0] = '\0';
  }
}

static const char kDegradedMarker[] = "probe degraded";

const char* DegradedSuffix(const HardwareSnapshot& hw) {
  return hw.probe_degraded ? ", probe degraded, defaults assumed" : "";
}

SelectionDecision ShortCircuit(memory::AllocatorType chosen, RuleId rule, const char* why,
                               const HardwareSnapshot& hw) {
  SelectionDecision decision = SelectionDecision();
  decision.chosen = chosen;
  decision.rule_id = rule;
  SetReason(&decision, "%s - %s [rule %s] (hardware not consulted%s)",
            memory::AllocatorTypeName(chosen), why, RuleIdName(rule), DegradedSuffix(hw));
  return decision;
}

SelectionDecision DecideDesktopRelease(const PlatformProfile& profile, const HardwareSnapshot& hw,
                                       const PolicyOptions& options) {
  SelectionDecision decision = SelectionDecision();
  decision.rule_id = RuleId::kDesktopRelease;

  char memory[32];
  FormatMemorySizeTo(hw.total_memory_bytes, memory, sizeof(memory));

  const bool enough_cores = hw.cpu_cores >= options.core_threshold;
  const bool hpg_available =
      profile.available_backends.Contains(memory::AllocatorType::kHighPerformanceGeneral);

  const char* why = NULL;
  if (enough_cores && hpg_available) {
    if (profile.secure_mode &&
        profile.available_backends.Contains(memory::AllocatorType::kPlatformSecureNative)) {
      decision.chosen = memory::AllocatorType::kPlatformSecureNative;
      why = "secure mode, hardened allocator on multi-threaded hardware";
    } else {
      decision.chosen = memory::AllocatorType::kHighPerformanceGeneral;
      why = "selected by runtime hardware analysis";
    }
  } else if (enough_cores) {
    decision.chosen = memory::AllocatorType::kSystem;
    why = "high-performance backend not compiled in";
  } else {
    decision.chosen = memory::AllocatorType::kSystem;
    why = "low core count";
  }

  SetReason(&decision, "%s - %s [rule %s] (%u cores %s threshold %u, %s total RAM%s)",
            memory::AllocatorTypeName(decision.chosen), why, RuleIdName(decision.rule_id),
            static_cast<unsigned>(hw.cpu_cores), enough_cores ? ">=" : "<",
            static_cast<unsigned>(options.core_threshold), memory, DegradedSuffix(hw));
  return decision;
}

}  // namespace

const char* RuleIdName(RuleId rule) {
  switch (rule) {
    case RuleId::kNoHeapOs:
      return "no-heap-os";
    case RuleId::kDebugBuild:
      return "debug-build";
    case RuleId::kWasm:
      return "wasm";
    case RuleId::kMobile:
      return "mobile";
    case RuleId::kNativeTuned:
      return "native-tuned";
    case RuleId::kDesktopRelease:
      return "desktop-release";
    case RuleId::kBuildOverride:
      return "build-override";
    default:
      return "unknown";
  }
}

const char* MobilePolicyName(MobilePolicy policy) {
  switch (policy) {
    case MobilePolicy::kPreferSecureNative:
      return "secure_native";
    case MobilePolicy::kSystem:
      return "system";
    default:
      return "unknown";
  }
}

PolicyOptions DefaultPolicyOptions() {
  PolicyOptions options;
  options.core_threshold = kBuildCoreThreshold > 0 ? kBuildCoreThreshold : 1;
#if defined(AUTOALLOC_MOBILE_PREFERS_SYSTEM)
  options.mobile_policy = MobilePolicy::kSystem;
#else
  options.mobile_policy = MobilePolicy::kPreferSecureNative;
#endif
  return options;
}

bool PolicyConsultsHardware(const PlatformProfile& profile) {
  return !profile.is_no_heap_os && profile.build_mode == BuildMode::kRelease && !profile.is_wasm &&
         profile.os_family != OsFamily::kMobile && profile.os_family != OsFamily::kBsdLike &&
         profile.os_family != OsFamily::kSolarisLike;
}

SelectionDecision Decide(const PlatformProfile& profile, const HardwareSnapshot& hw) {
  return Decide(profile, hw, DefaultPolicyOptions());
}

SelectionDecision Decide(const PlatformProfile& profile, const HardwareSnapshot& hw,
                         const PolicyOptions& options) {
  if (profile.is_no_heap_os) {
    return ShortCircuit(memory::AllocatorType::kEmbeddedHeap, RuleId::kNoHeapOs,
                        "no-heap target, fixed arena", hw);
  }
  if (profile.build_mode == BuildMode::kDebug) {
    return ShortCircuit(memory::AllocatorType::kSystem, RuleId::kDebugBuild,
                        "debug build, tool-friendly native heap", hw);
  }
  if (profile.is_wasm) {
    return ShortCircuit(memory::AllocatorType::kSystem, RuleId::kWasm,
                        "WASM environment, smallest code size", hw);
  }
  if (profile.os_family == OsFamily::kMobile) {
    if (options.mobile_policy == MobilePolicy::kPreferSecureNative &&
        profile.available_backends.Contains(memory::AllocatorType::kPlatformSecureNative)) {
      return ShortCircuit(memory::AllocatorType::kPlatformSecureNative, RuleId::kMobile,
                          "mobile platform, hardened native allocator", hw);
    }
    return ShortCircuit(memory::AllocatorType::kSystem, RuleId::kMobile,
                        "mobile platform, native allocator", hw);
  }
  if (profile.os_family == OsFamily::kBsdLike || profile.os_family == OsFamily::kSolarisLike) {
    return ShortCircuit(memory::AllocatorType::kSystem, RuleId::kNativeTuned,
                        profile.os_family == OsFamily::kBsdLike
                            ? "BSD platform, tuned native allocator"
                            : "Solaris platform, tuned native allocator",
                        hw);
  }
  return DecideDesktopRelease(profile, hw, options);
}

SelectionDecision ApplyBuildOverride(const SelectionDecision& decision,
                                     memory::AllocatorType pinned,
                                     const PlatformProfile& profile) {
  SelectionDecision out = decision;
  if (!profile.available_backends.Contains(pinned)) {
    char kept[kReasonCapacity];
    std::memcpy(kept, decision.reason, sizeof(kept));
    kept[sizeof(kept) - 1] = '\0';
    SetReason(&out, "%s; build pin %s ignored, backend not compiled in", kept,
              memory::AllocatorTypeName(pinned));
    return out;
  }
  out.chosen = pinned;
  out.rule_id = RuleId::kBuildOverride;
  SetReason(&out, "%s - pinned at build time [rule %s] (policy chose %s via %s)",
            memory::AllocatorTypeName(pinned), RuleIdName(RuleId::kBuildOverride),
            memory::AllocatorTypeName(decision.chosen), RuleIdName(decision.rule_id));
  return out;
}

SelectionDecision WithProbeState(const SelectionDecision& decision, const HardwareSnapshot& hw) {
  SelectionDecision out = decision;
  if (!hw.probe_degraded || std::strstr(decision.reason, kDegradedMarker) != NULL) {
    return out;
  }
  char kept[kReasonCapacity];
  std::memcpy(kept, decision.reason, sizeof(kept));
  kept[sizeof(kept) - 1] = '\0';
  const std::size_t len = std::strlen(kept);
  if (len > 0 && kept[len - 1] == ')') {
    kept[len - 1] = '\0';
    SetReason(&out, "%s%s)", kept, DegradedSuffix(hw));
  } else {
    SetReason(&out, "%s%s", kept, DegradedSuffix(hw));
  }
  return out;
}

}  // namespace selection
}  // namespace autoalloc
