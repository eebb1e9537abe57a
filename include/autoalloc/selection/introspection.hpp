#pragma once

#include <cstdint>
#include <string>

#include "autoalloc/api/export.hpp"
#include "autoalloc/api/status.hpp"
#include "autoalloc/json/i_json.hpp"
#include "autoalloc/memory/iallocator.hpp"
#include "autoalloc/selection/selection_policy.hpp"

namespace autoalloc {
namespace selection {

struct SystemInfo {
  std::uint32_t cpu_cores = 1;
  std::uint64_t total_memory_bytes = 0;
  std::string os;
  std::string arch;
  bool is_wasm = false;
  bool is_debug = false;
};

struct AllocatorInfo {
  memory::AllocatorType allocator_type = memory::AllocatorType::kSystem;
  std::string reason;
  SystemInfo system_info;
};

struct Recommendation {
  memory::AllocatorType allocator_type = memory::AllocatorType::kSystem;
  std::string reason;
};

struct OptimizationCheck {
  bool is_optimal = true;
  // Empty when is_optimal.
  std::string suggestion;

  bool has_suggestion() const { return !suggestion.empty(); }
};

// Bound decision plus the cached hardware snapshot. Built once on first
// call; every call returns the same object. Lock-free after the first call.
AUTOALLOC_API const AllocatorInfo& GetAllocatorInfo();

// Fresh rule evaluation against the cached snapshot and the current audit
// options. Never re-probes hardware and never rebinds.
AUTOALLOC_API Recommendation GetRecommendedAllocator();

// Compares the bound backend with GetRecommendedAllocator(). On mismatch the
// suggestion reads "Current: X, Recommended: Y (<reason>)".
AUTOALLOC_API OptimizationCheck CheckAllocatorOptimization();

// "0B", "512B", "1KB", "1.5KB", "16GB", ... up to PB. One truncated decimal.
AUTOALLOC_API std::string FormatMemorySize(std::uint64_t bytes);

AUTOALLOC_API memory::AllocatorType CurrentAllocatorType();

// Replaces the audit options. They feed GetRecommendedAllocator() and
// CheckAllocatorOptimization() only; the bound decision is never affected.
// Params:
// - options: core_threshold must be > 0; mobile_policy one of MobilePolicy.
// Returns:
// - kOk: options applied and logged at INFO.
// - kInvalidArgument: core_threshold is 0 or mobile_policy is out of range;
//   the previous options stay.
// Thread safety: thread safe.
AUTOALLOC_API api::Status ConfigureAudit(const PolicyOptions& options);

// Reads the "selection" object of a JSON config file:
// {
//   "selection": {
//     "core_threshold": 4,
//     "mobile_policy": "secure_native|system"
//   }
// }
// Missing keys, or a missing "selection" object, keep the current values.
// Params:
// - config_path: path of the JSON file.
// Returns:
// - kOk: options applied through ConfigureAudit.
// - kNotFound: the file cannot be opened.
// - kInvalidArgument: malformed JSON or an invalid value. Nothing is applied.
// Thread safety: thread safe.
AUTOALLOC_API api::Status ConfigureAuditFromFile(const std::string& config_path);

AUTOALLOC_API PolicyOptions CurrentAuditOptions();

AUTOALLOC_API json::Json AllocatorInfoToJson(const AllocatorInfo& info);

}  // namespace selection
}  // namespace autoalloc
