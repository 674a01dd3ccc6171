#pragma once

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace mediamgr::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// "error" | "warn" | "info" | "debug"; anything else -> def
[[nodiscard]] LogLevel parse_log_level(std::string_view s, LogLevel def = LogLevel::Info);

// Process-wide diagnostic sink. Lines go to stderr as
// "mediamgr: <Component>: <message>" and, when a file is attached,
// are appended there with a timestamp and level.
class Logger {
public:
  static Logger& instance();

  void set_level(LogLevel lvl) { level_ = lvl; }
  [[nodiscard]] LogLevel level() const { return level_; }
  void set_stderr(bool on) { to_stderr_ = on; }

  // Attach (or with an empty path, detach) the mirror file. The parent
  // directory is created; returns false if the file cannot be opened.
  bool attach_file(const std::filesystem::path& path);

  void write(LogLevel lvl, const char* component, const std::string& msg);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

private:
  Logger() = default;
  ~Logger();

  LogLevel level_{LogLevel::Info};
  bool to_stderr_{true};
  std::FILE* file_{nullptr};
};

void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace mediamgr::util
