#include "autoalloc/log/log_manager.hpp"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#if defined(_WIN32)
#include <direct.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif
#include <glog/logging.h>
#include <memory>
#include <mutex>

#include "autoalloc/json/i_json.hpp"

namespace autoalloc {
namespace log {

#define AA_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kLog)
namespace {

std::mutex& GlobalMutex() {
  static std::mutex m;
  return m;
}

LoggingOptions& GlobalOptions() {
  static LoggingOptions opts;
  return opts;
}

std::unique_ptr<google::LogSink>& GlobalSink() {
  static std::unique_ptr<google::LogSink> sink;
  return sink;
}

bool& GlobalInitialized() {
  static bool initialized = false;
  return initialized;
}

bool& GlobalFailureHandlerInstalled() {
  static bool installed = false;
  return installed;
}

bool IsPathSeparator(char c) { return c == '/' || c == '\\'; }

std::string BaseName(const std::string& path) {
  if (path.empty()) return {};
  size_t end = path.size();
  while (end > 0 && IsPathSeparator(path[end - 1])) --end;
  if (end == 0) return {};
  const size_t pos = path.find_last_of("/\\", end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (IsPathSeparator(left[left.size() - 1])) return left + right;
#if defined(_WIN32)
  return left + "\\" + right;
#else
  return left + "/" + right;
#endif
}

bool DirectoryExists(const std::string& path) {
  if (path.empty()) return false;
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
#endif
  return (info.st_mode & S_IFDIR) != 0;
}

int MakeDir(const std::string& path) {
#if defined(_WIN32)
  return _mkdir(path.c_str());
#else
  return mkdir(path.c_str(), 0755);
#endif
}

bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;

  std::string current;
  size_t pos = 0;
  if (IsPathSeparator(path[0])) {
    current = path.substr(0, 1);
    pos = 1;
  }

  while (pos <= path.size()) {
    size_t next = path.find_first_of("/\\", pos);
    std::string part =
        next == std::string::npos ? path.substr(pos) : path.substr(pos, next - pos);
    if (!part.empty()) {
      current = current.empty() ? part : JoinPath(current, part);
      if (!DirectoryExists(current)) {
        errno = 0;
        if (MakeDir(current) != 0 && errno != EEXIST) return false;
      }
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

int ClampInt(int value, int low, int high) {
  if (value < low) return low;
  if (value > high) return high;
  return value;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool LevelFromJson(const json::Json& value, int* out) {
  if (value.is_number_integer()) {
    *out = ClampInt(value.get<int>(), 0, 3);
    return true;
  }
  if (!value.is_string()) return false;
  const std::string v = ToLower(value.get<std::string>());
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else {
    return false;
  }
  return true;
}

api::Status ReadBool(const json::Json& section, const char* key, bool* out) {
  if (!section.contains(key)) return api::Status::Ok();
  if (!section[key].is_boolean()) {
    return AA_STATUS(api::StatusCode::kInvalidArgument,
                     std::string("logging.") + key + " must be boolean");
  }
  *out = section[key].get<bool>();
  return api::Status::Ok();
}

api::Status ReadLevel(const json::Json& section, const char* key, int* out) {
  if (!section.contains(key)) return api::Status::Ok();
  if (!LevelFromJson(section[key], out)) {
    return AA_STATUS(api::StatusCode::kInvalidArgument,
                     std::string("logging.") + key + " must be a severity name or 0..3");
  }
  return api::Status::Ok();
}

api::Result<LoggingOptions> ParseSection(const json::Json& section) {
  LoggingOptions options;
  if (section.contains("log_dir")) {
    if (!section["log_dir"].is_string()) {
      return api::Result<LoggingOptions>(
          AA_STATUS(api::StatusCode::kInvalidArgument, "logging.log_dir must be string"));
    }
    options.log_dir = section["log_dir"].get<std::string>();
  }

  api::Status st = ReadBool(section, "json_format", &options.json_format);
  if (st.ok()) {
    st = ReadBool(section, "install_failure_signal_handler",
                  &options.install_failure_signal_handler);
  }
  if (st.ok()) st = ReadBool(section, "logtostderr", &options.logtostderr);
  if (st.ok()) st = ReadBool(section, "alsologtostderr", &options.alsologtostderr);
  if (st.ok()) st = ReadBool(section, "colorlogtostderr", &options.colorlogtostderr);
  if (st.ok()) st = ReadLevel(section, "min_log_level", &options.min_log_level);
  if (st.ok()) st = ReadLevel(section, "stderr_threshold", &options.stderr_threshold);
  if (!st.ok()) return api::Result<LoggingOptions>(st);

  if (section.contains("verbosity")) {
    if (!section["verbosity"].is_number_integer()) {
      return api::Result<LoggingOptions>(
          AA_STATUS(api::StatusCode::kInvalidArgument, "logging.verbosity must be integer"));
    }
    options.verbosity = section["verbosity"].get<int>();
  }
  return api::Result<LoggingOptions>(options);
}

std::tm LocalTime(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

std::string TimestampPrefix() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto t = system_clock::to_time_t(now);
  const std::tm tm = LocalTime(t);
  const auto us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000LL;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(us));
  return std::string(buf);
}

char LevelChar(google::LogSeverity severity) {
  const char levels[] = {'I', 'W', 'E', 'F'};
  return levels[ClampInt(static_cast<int>(severity), 0, 3)];
}

class JsonLinesSink : public google::LogSink {
 public:
  explicit JsonLinesSink(const std::string& file_path) : stream_(file_path.c_str(), std::ios::app) {}

  bool is_open() const { return stream_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char* base_filename, int line,
            const std::tm*, const char* message, size_t message_len) override {
    std::string msg = message ? std::string(message, message_len) : std::string();
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    json::Json record = json::Json::object();
    record["ts"] = TimestampPrefix();
    record["level"] = std::string(1, LevelChar(severity));
    record["file"] = base_filename ? base_filename : "";
    record["line"] = line;
    record["message"] = msg;

    std::lock_guard<std::mutex> lock(stream_mu_);
    if (!stream_.is_open()) return;
    stream_ << record.dump(-1, ' ', false, json::Json::error_handler_t::replace) << '\n';
    stream_.flush();
  }

 private:
  std::mutex stream_mu_;
  std::ofstream stream_;
};

bool ApplyOptionsLocked(const LoggingOptions& options) {
  std::string output_dir;
  if (!options.log_dir.empty()) {
    if (!CreateDirectories(options.log_dir)) return false;
    output_dir = options.log_dir;
  }

  std::unique_ptr<JsonLinesSink> next_sink;
  if (options.json_format) {
    const std::string base = output_dir.empty() ? "." : output_dir;
    next_sink.reset(new JsonLinesSink(JoinPath(base, "autoalloc.jsonl")));
    if (!next_sink->is_open()) return false;
  }

  FLAGS_log_dir = output_dir;
  FLAGS_logtostderr = output_dir.empty() ? true : options.logtostderr;
  FLAGS_alsologtostderr = options.alsologtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !GlobalFailureHandlerInstalled()) {
    google::InstallFailureSignalHandler();
    GlobalFailureHandlerInstalled() = true;
  }

  // Rebuild the sink on each apply so reload can switch path safely.
  if (GlobalSink()) {
    google::RemoveLogSink(GlobalSink().get());
    GlobalSink().reset();
  }
  if (next_sink) {
    GlobalSink().reset(next_sink.release());
    google::AddLogSink(GlobalSink().get());
  }

  GlobalOptions() = options;
  return true;
}

}  // namespace

api::Result<LoggingOptions> LogManager::ParseOptions(const std::string& config_path) {
  if (config_path.empty()) {
    return api::Result<LoggingOptions>(LoggingOptions());
  }
  api::Result<json::Json> section = json::JsonCodec::LoadSection(config_path, "logging");
  if (!section.ok()) {
    return api::Result<LoggingOptions>(section.status());
  }
  return ParseSection(section.value());
}

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (GlobalInitialized()) return api::Status::Ok();

  api::Result<LoggingOptions> options = ParseOptions(config_path);
  if (!options.ok()) return options.status();

  // Boot diagnostics go to stderr until log_dir and sinks are applied.
  FLAGS_logtostderr = true;
  const std::string sanitized_app_name =
      BaseName(app_name).empty() ? "autoalloc" : BaseName(app_name);
  google::InitGoogleLogging(sanitized_app_name.c_str());

  if (!ApplyOptionsLocked(options.value())) {
    if (GlobalSink()) {
      google::RemoveLogSink(GlobalSink().get());
      GlobalSink().reset();
    }
    google::ShutdownGoogleLogging();
    return AA_STATUS(api::StatusCode::kIoError, "cannot prepare log output directory or sink");
  }

  GlobalInitialized() = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) {
    return AA_STATUS(api::StatusCode::kNotInitialized, "LogManager::Init has not run");
  }

  api::Result<LoggingOptions> options = ParseOptions(config_path);
  if (!options.ok()) return options.status();
  if (!ApplyOptionsLocked(options.value())) {
    return AA_STATUS(api::StatusCode::kIoError, "cannot apply reloaded logging options");
  }
  return api::Status::Ok();
}

LoggingOptions LogManager::CurrentOptions() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalOptions();
}

bool LogManager::IsInitialized() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalInitialized();
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) return;
  if (GlobalSink()) {
    google::RemoveLogSink(GlobalSink().get());
    GlobalSink().reset();
  }
  google::ShutdownGoogleLogging();
  GlobalOptions() = LoggingOptions();
  GlobalInitialized() = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const google::LogSeverity glog_severity =
      static_cast<google::LogSeverity>(ClampInt(static_cast<int>(severity), 0, 3));
  google::LogMessage(__FILE__, __LINE__, glog_severity).stream() << message;
}

#undef AA_STATUS

}  // namespace log
}  // namespace autoalloc
