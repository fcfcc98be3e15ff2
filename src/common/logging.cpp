#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace pacsat {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
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

void Logger::set_stream(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out ? out : stderr;
}

// 2024-05-01 12:00:00.250 [WARN] ftl0: ...
void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
  std::fprintf(out_, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out_, fmt, ap);
  va_end(ap);
  std::fputc('\n', out_);
  std::fflush(out_);
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

} // namespace pacsat
