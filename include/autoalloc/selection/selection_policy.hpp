#pragma once

#include <cstddef>

#include "autoalloc/api/export.hpp"
#include "autoalloc/memory/iallocator.hpp"
#include "autoalloc/selection/hardware_snapshot.hpp"
#include "autoalloc/selection/platform_profile.hpp"

namespace autoalloc {
namespace selection {

enum class RuleId {
  kNoHeapOs,
  kDebugBuild,
  kWasm,
  kMobile,
  kNativeTuned,
  kDesktopRelease,
  kBuildOverride
};

// Stable identifier of a rule ("no-heap-os", "desktop-release", ...).
AUTOALLOC_API const char* RuleIdName(RuleId rule);

enum class MobilePolicy { kPreferSecureNative, kSystem };

AUTOALLOC_API const char* MobilePolicyName(MobilePolicy policy);

struct PolicyOptions {
  // Minimum core count for HighPerformanceGeneral on desktop release.
  std::uint32_t core_threshold = 2;
  MobilePolicy mobile_policy = MobilePolicy::kPreferSecureNative;
};

// Options baked in at build time (AUTOALLOC_CORE_THRESHOLD,
// AUTOALLOC_MOBILE_PREFERS_SYSTEM).
AUTOALLOC_API PolicyOptions DefaultPolicyOptions();

static const std::size_t kReasonCapacity = 256;

// Plain storage only, so a decision can be built and kept in static memory
// before any allocator exists.
struct SelectionDecision {
  memory::AllocatorType chosen;
  RuleId rule_id;
  char reason[kReasonCapacity];
};

// Ordered rule table, first match wins:
//   1. no-heap OS                  -> EmbeddedHeap
//   2. debug build                 -> System
//   3. wasm                        -> System
//   4. mobile                      -> PlatformSecureNative or System, per options
//   5. bsd-like / solaris-like     -> System
//   6. otherwise                   -> HighPerformanceGeneral when cores >= threshold
//                                     and compiled in (PlatformSecureNative in
//                                     secure mode), else System
// Params:
// - profile: compile-time facts; ResolveProfile() for this build.
// - hw: hardware facts, read by rule 6 only; a degraded snapshot adds
//   ", probe degraded, defaults assumed" to the reason of any rule.
// - options: threshold and mobile rule; DefaultPolicyOptions() when omitted.
// Returns:
// - the chosen backend, always one of profile.available_backends or System,
//   with the matched rule id and a reason "<Type> - <why> [rule <id>] (...)".
// Thread safety: pure, total and deterministic. Never allocates.
AUTOALLOC_API SelectionDecision Decide(const PlatformProfile& profile, const HardwareSnapshot& hw);
AUTOALLOC_API SelectionDecision Decide(const PlatformProfile& profile, const HardwareSnapshot& hw,
                                       const PolicyOptions& options);

// True when the profile falls through to rule 6, the only rule that reads
// hardware facts.
AUTOALLOC_API bool PolicyConsultsHardware(const PlatformProfile& profile);

// Replaces a policy decision with a backend pinned at build time. The pin
// only takes effect when the pinned backend is available in the profile;
// otherwise the decision is kept and its reason notes the ignored pin.
AUTOALLOC_API SelectionDecision ApplyBuildOverride(const SelectionDecision& decision,
                                                   memory::AllocatorType pinned,
                                                   const PlatformProfile& profile);

// Returns decision with the probe-degraded marker added to its reason when
// hw is degraded and the reason does not carry it yet. Used when a decision
// was made without hardware and the snapshot was taken afterwards. The
// marker goes inside the trailing "(...)" facts group when there is one.
// Never allocates.
AUTOALLOC_API SelectionDecision WithProbeState(const SelectionDecision& decision,
                                               const HardwareSnapshot& hw);

}  // namespace selection
}  // namespace autoalloc
