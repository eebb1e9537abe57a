#include "autoalloc/selection/introspection.hpp"

#include <atomic>
#include <mutex>
#include <new>
#include <sstream>
#include <type_traits>

#include "autoalloc/log/log_manager.hpp"
#include "autoalloc/memory/i_global_allocator.hpp"

namespace autoalloc {
namespace selection {

#define AA_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kSelection, (detail))

namespace {

std::mutex& AuditMu() {
  static std::mutex mu;
  return mu;
}

PolicyOptions& AuditOptions() {
  static PolicyOptions options = DefaultPolicyOptions();
  return options;
}

std::once_flag g_info_once;
std::atomic<bool> g_info_ready(false);

// Never destroyed, so static destructors running at exit still read it.
AllocatorInfo& InfoStorage() {
  static std::aligned_storage<sizeof(AllocatorInfo), alignof(AllocatorInfo)>::type storage;
  static AllocatorInfo* info = new (&storage) AllocatorInfo();
  return *info;
}

void BuildInfoOnce() {
  const SelectionDecision& decision = memory::GlobalAllocator::Bind();
  const PlatformProfile profile = ResolveProfile();
  const HardwareSnapshot& hw = CachedHardwareSnapshot();

  // The bound decision skips the probe on short-circuit rules; the snapshot
  // taken here may still be degraded.
  const SelectionDecision reported = WithProbeState(decision, hw);

  AllocatorInfo& info = InfoStorage();
  info.allocator_type = reported.chosen;
  info.reason = reported.reason;
  info.system_info.cpu_cores = hw.cpu_cores;
  info.system_info.total_memory_bytes = hw.total_memory_bytes;
  info.system_info.os = profile.os;
  info.system_info.arch = profile.arch;
  info.system_info.is_wasm = profile.is_wasm;
  info.system_info.is_debug = profile.build_mode == BuildMode::kDebug;
  g_info_ready.store(true, std::memory_order_release);

  // Bind() runs before logging is safe, so the selection is reported here.
  std::ostringstream oss;
  oss << "allocator selected: " << memory::AllocatorTypeName(info.allocator_type) << " ("
      << memory::GlobalAllocator::CurrentBackendName() << "), " << info.reason;
  log::LogManager::Log(log::LogSeverity::kInfo, oss.str());
}

api::Status ValidateOptions(const PolicyOptions& options) {
  if (options.core_threshold == 0) {
    return AA_STATUS(api::StatusCode::kInvalidArgument, "selection.core_threshold must be > 0",
                     api::kSelDetailInvalidThreshold);
  }
  if (options.mobile_policy != MobilePolicy::kPreferSecureNative &&
      options.mobile_policy != MobilePolicy::kSystem) {
    return AA_STATUS(api::StatusCode::kInvalidArgument, "selection.mobile_policy is invalid",
                     api::kSelDetailInvalidMobilePolicy);
  }
  return api::Status::Ok();
}

api::Status ParseMobilePolicy(const std::string& value, MobilePolicy* out) {
  if (value == "secure_native") {
    *out = MobilePolicy::kPreferSecureNative;
    return api::Status::Ok();
  }
  if (value == "system") {
    *out = MobilePolicy::kSystem;
    return api::Status::Ok();
  }
  return AA_STATUS(api::StatusCode::kInvalidArgument,
                   "selection.mobile_policy must be secure_native or system",
                   api::kSelDetailInvalidMobilePolicy);
}

}  // namespace

const AllocatorInfo& GetAllocatorInfo() {
  if (!g_info_ready.load(std::memory_order_acquire)) {
    std::call_once(g_info_once, &BuildInfoOnce);
  }
  return InfoStorage();
}

Recommendation GetRecommendedAllocator() {
  const SelectionDecision decision =
      Decide(ResolveProfile(), CachedHardwareSnapshot(), CurrentAuditOptions());
  Recommendation rec;
  rec.allocator_type = decision.chosen;
  rec.reason = decision.reason;
  return rec;
}

OptimizationCheck CheckAllocatorOptimization() {
  const memory::AllocatorType current = CurrentAllocatorType();
  const Recommendation rec = GetRecommendedAllocator();

  OptimizationCheck check;
  check.is_optimal = current == rec.allocator_type;
  if (!check.is_optimal) {
    check.suggestion = std::string("Current: ") + memory::AllocatorTypeName(current) +
                       ", Recommended: " + memory::AllocatorTypeName(rec.allocator_type) + " (" +
                       rec.reason + ")";
    log::LogManager::Log(log::LogSeverity::kWarning, "allocator not optimal: " + check.suggestion);
  }
  return check;
}

std::string FormatMemorySize(std::uint64_t bytes) {
  char buf[32];
  const std::size_t len = FormatMemorySizeTo(bytes, buf, sizeof(buf));
  return std::string(buf, len);
}

memory::AllocatorType CurrentAllocatorType() { return memory::GlobalAllocator::BoundType(); }

api::Status ConfigureAudit(const PolicyOptions& options) {
  api::Status st = ValidateOptions(options);
  if (!st.ok()) {
    return st;
  }
  {
    std::lock_guard<std::mutex> lock(AuditMu());
    AuditOptions() = options;
  }
  std::ostringstream oss;
  oss << "audit options applied: core_threshold=" << options.core_threshold
      << ", mobile_policy=" << MobilePolicyName(options.mobile_policy);
  log::LogManager::Log(log::LogSeverity::kInfo, oss.str());
  return api::Status::Ok();
}

api::Status ConfigureAuditFromFile(const std::string& config_path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadSection(config_path, "selection");
  if (!loaded.ok()) {
    return loaded.status();
  }
  const json::Json& selection = loaded.value();

  PolicyOptions options = CurrentAuditOptions();

  if (selection.contains("core_threshold")) {
    const json::Json& value = selection["core_threshold"];
    if (!value.is_number_integer() || value.get<long long>() <= 0 ||
        value.get<unsigned long long>() > 0xFFFFFFFFull) {
      return AA_STATUS(api::StatusCode::kInvalidArgument,
                       "selection.core_threshold must be a positive integer",
                       api::kSelDetailInvalidThreshold);
    }
    options.core_threshold = value.get<std::uint32_t>();
  }

  if (selection.contains("mobile_policy")) {
    if (!selection["mobile_policy"].is_string()) {
      return AA_STATUS(api::StatusCode::kInvalidArgument,
                       "selection.mobile_policy must be string",
                       api::kSelDetailInvalidMobilePolicy);
    }
    api::Status st =
        ParseMobilePolicy(selection["mobile_policy"].get<std::string>(), &options.mobile_policy);
    if (!st.ok()) {
      return st;
    }
  }

  return ConfigureAudit(options);
}

PolicyOptions CurrentAuditOptions() {
  std::lock_guard<std::mutex> lock(AuditMu());
  return AuditOptions();
}

json::Json AllocatorInfoToJson(const AllocatorInfo& info) {
  json::Json system_info = json::Json::object();
  system_info["cpu_cores"] = info.system_info.cpu_cores;
  system_info["total_memory_bytes"] = info.system_info.total_memory_bytes;
  system_info["total_memory"] = FormatMemorySize(info.system_info.total_memory_bytes);
  system_info["os"] = info.system_info.os;
  system_info["arch"] = info.system_info.arch;
  system_info["is_wasm"] = info.system_info.is_wasm;
  system_info["is_debug"] = info.system_info.is_debug;

  json::Json out = json::Json::object();
  out["allocator_type"] = memory::AllocatorTypeName(info.allocator_type);
  out["backend"] = memory::GlobalAllocator::BackendDisplayName(info.allocator_type);
  out["reason"] = info.reason;
  out["system_info"] = system_info;
  return out;
}

#undef AA_STATUS

}  // namespace selection
}  // namespace autoalloc
