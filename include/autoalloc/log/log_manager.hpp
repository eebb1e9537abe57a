#pragma once

#include <string>

#include "autoalloc/api/export.hpp"
#include "autoalloc/api/status.hpp"
#include "autoalloc/log/log_types.hpp"

namespace autoalloc {
namespace log {

class AUTOALLOC_API LogManager {
 public:
  // Initialize glog with an application name and optional JSON config file.
  // Safe to call once at process startup; later calls return kOk without changes.
  static api::Status Init(const std::string& app_name, const std::string& config_path = {});

  // Reload the "logging" section at runtime. On failure the applied options are kept.
  static api::Status Reload(const std::string& config_path);

  // Access the currently applied options.
  static LoggingOptions CurrentOptions();

  static bool IsInitialized();

  // Shutdown glog. Call once during program teardown.
  static void Shutdown();

  // Lightweight logging API that avoids exposing glog headers to callers.
  // Works before Init(); glog then writes to stderr.
  static void Log(LogSeverity severity, const std::string& message);

  // Parse a "logging" JSON object into options. Exposed for config validation.
  static api::Result<LoggingOptions> ParseOptions(const std::string& config_path);
};

}  // namespace log
}  // namespace autoalloc
