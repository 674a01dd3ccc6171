#include "util/Log.hpp"

#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <ctime>

namespace mediamgr::util {

LogLevel parse_log_level(std::string_view s, LogLevel def) {
  if (s == "error") return LogLevel::Error;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "info") return LogLevel::Info;
  if (s == "debug") return LogLevel::Debug;
  return def;
}

static const char* level_tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "INFO";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::~Logger() {
  if (file_) std::fclose(file_);
}

bool Logger::attach_file(const std::filesystem::path& path) {
  if (file_) { std::fclose(file_); file_ = nullptr; }
  if (path.empty()) return true;
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    std::fprintf(stderr, "mediamgr: Logger: failed to create %s: %s\n",
                 path.parent_path().c_str(), ec.message().c_str());
    return false;
  }
  file_ = std::fopen(path.c_str(), "a");
  if (!file_) {
    std::fprintf(stderr, "mediamgr: Logger: failed to open %s: %s\n",
                 path.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

void Logger::write(LogLevel lvl, const char* component, const std::string& msg) {
  if (static_cast<int>(lvl) > static_cast<int>(level_)) return;
  if (to_stderr_) std::fprintf(stderr, "mediamgr: %s: %s\n", component, msg.c_str());
  if (file_) {
    auto now_t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&now_t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
    std::fprintf(file_, "%s [%s] %s: %s\n", ts, level_tag(lvl), component, msg.c_str());
    std::fflush(file_);
  }
}

static std::string vformat(const char* fmt, va_list ap) {
  va_list cp;
  va_copy(cp, ap);
  int n = std::vsnprintf(nullptr, 0, fmt, cp);
  va_end(cp);
  if (n <= 0) return std::string();
  std::string out(static_cast<size_t>(n) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, ap);
  out.resize(static_cast<size_t>(n));
  return out;
}

static void vlog(LogLevel lvl, const char* component, const char* fmt, va_list ap) {
  auto& lg = Logger::instance();
  if (static_cast<int>(lvl) > static_cast<int>(lg.level())) return;
  lg.write(lvl, component, vformat(fmt, ap));
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Error, component, fmt, ap);
  va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Warn, component, fmt, ap);
  va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Info, component, fmt, ap);
  va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(LogLevel::Debug, component, fmt, ap);
  va_end(ap);
}

} // namespace mediamgr::util
