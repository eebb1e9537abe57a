#include "autoalloc/api/status.hpp"

#include <cstdio>

namespace autoalloc {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define AUTOALLOC_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kNotInitialized, 0x0000),
     "CORE_NOT_INITIALIZED", "Object not initialized"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kAlreadyInitialized, 0x0000),
     "CORE_ALREADY_INITIALIZED", "Object already initialized"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {AUTOALLOC_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    // Module detail ids; keep appending here as a unified lookup table.
    {AUTOALLOC_ECODE(ErrorModule::kMemory, StatusCode::kInvalidArgument, kMemDetailInvalidSize),
     "MEM_INVALID_SIZE", "Allocation size must be > 0"},
    {AUTOALLOC_ECODE(ErrorModule::kMemory, StatusCode::kInvalidArgument,
                     kMemDetailInvalidAlignment),
     "MEM_INVALID_ALIGNMENT", "Invalid memory alignment"},
    {AUTOALLOC_ECODE(ErrorModule::kMemory, StatusCode::kInternalError,
                     kMemDetailBackendExhausted),
     "MEM_BACKEND_EXHAUSTED", "Allocator backend could not satisfy the request"},
    {AUTOALLOC_ECODE(ErrorModule::kMemory, StatusCode::kUnsupported, kMemDetailBackendDisabled),
     "MEM_BACKEND_DISABLED", "Allocator backend is not compiled into this build"},
    {AUTOALLOC_ECODE(ErrorModule::kSelection, StatusCode::kInvalidArgument,
                     kSelDetailInvalidThreshold),
     "SEL_INVALID_CORE_THRESHOLD", "Core threshold must be a positive integer"},
    {AUTOALLOC_ECODE(ErrorModule::kSelection, StatusCode::kInvalidArgument,
                     kSelDetailInvalidMobilePolicy),
     "SEL_INVALID_MOBILE_POLICY", "Mobile policy must be secure_native or system"},
    {AUTOALLOC_ECODE(ErrorModule::kSelection, StatusCode::kAlreadyInitialized,
                     kSelDetailProbeAlreadyRun),
     "SEL_PROBE_ALREADY_RUN", "Hardware snapshot was already probed"},
    {AUTOALLOC_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, 0x0001),
     "JSON_PARSE_FAILED", "JSON parse failed"},
};

#undef AUTOALLOC_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kMemory:
      return "memory";
    case ErrorModule::kSelection:
      return "selection";
    case ErrorModule::kJson:
      return "json";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotInitialized:
      return "kNotInitialized";
    case StatusCode::kAlreadyInitialized:
      return "kAlreadyInitialized";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

}  // namespace api
}  // namespace autoalloc
