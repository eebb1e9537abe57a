#pragma once

#include <string>

namespace autoalloc {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options read from the "logging" object of the config file
// and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool json_format = false;  // extra sink: JSON lines in <log_dir>/autoalloc.jsonl
  bool install_failure_signal_handler = false;
  bool logtostderr = true;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  int min_log_level = 0;     // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;  // glog treats this as ERROR by default
  int verbosity = 0;         // VLOG level
};

}  // namespace log
}  // namespace autoalloc
