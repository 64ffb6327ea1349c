
#include "logging.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

namespace brainlink {

std::optional<LogLevel> parse_log_level(const std::string &s) {
  std::string l;
  for (char c : s)
    l.push_back((char)std::tolower((unsigned char)c));
  if (l == "trace")
    return LogLevel::TRACE;
  if (l == "debug")
    return LogLevel::DEBUG;
  if (l == "info")
    return LogLevel::INFO;
  if (l == "warn" || l == "warning")
    return LogLevel::WARN;
  if (l == "error")
    return LogLevel::ERROR;
  return std::nullopt;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_.store(lvl); }
void Logger::set_sink(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = out;
}
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_.load())
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = sink_ ? sink_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tmv{};
#if defined(_WIN32)
  localtime_s(&tmv, &t);
#else
  localtime_r(&t, &tmv);
#endif
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
}

} // namespace brainlink
