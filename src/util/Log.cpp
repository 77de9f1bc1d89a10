#include "util/Log.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace mapwatch::util {

static bool quiet() {
  static const bool q = []{
    const char* v = std::getenv("MAPWATCH_QUIET");
    return v && *v && *v != '0';
  }();
  return q;
}

static const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

void log(LogLevel level, const char* fmt, ...) {
  if (level == LogLevel::Info && quiet()) return;

  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  // One fprintf per line; the lock keeps lines from the monitor and metrics threads whole
  static std::mutex mu;
  std::lock_guard<std::mutex> lk(mu);
  std::fprintf(stderr, "%s mapwatch: %s: %s\n", ts, level_name(level), msg);
}

} // namespace mapwatch::util
