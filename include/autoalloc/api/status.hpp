#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "autoalloc/api/export.hpp"

namespace autoalloc {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kAlreadyInitialized,
  kNotFound,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kMemory = 0x30,
  kSelection = 0x40,
  kJson = 0x60,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
AUTOALLOC_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                          std::uint32_t detail_id = 0);
AUTOALLOC_API const char* ErrorModuleName(ErrorModule module);
AUTOALLOC_API const char* StatusCodeName(StatusCode status_code);
AUTOALLOC_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
AUTOALLOC_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

// Module-local detail ids registered in the error catalog.
enum MemoryErrorDetail : std::uint32_t {
  kMemDetailInvalidSize = 0x0001,
  kMemDetailInvalidAlignment = 0x0002,
  kMemDetailBackendExhausted = 0x0003,
  kMemDetailBackendDisabled = 0x0004,
};

enum SelectionErrorDetail : std::uint32_t {
  kSelDetailInvalidThreshold = 0x0001,
  kSelDetailInvalidMobilePolicy = 0x0002,
  kSelDetailProbeAlreadyRun = 0x0003,
};

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : status_(Status::Ok()), value_(value) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace autoalloc
