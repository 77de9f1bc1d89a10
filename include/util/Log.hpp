#pragma once

namespace mapwatch::util {

enum class LogLevel { Info, Warn, Error };

// stderr logger: "<local time> mapwatch: <level>: <message>".
// Info lines are dropped when MAPWATCH_QUIET is set.
void log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace mapwatch::util
