#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mapwatch::model {

enum class Severity { Normal, Warning, Error, Unknown };

[[nodiscard]] constexpr std::string_view severity_name(Severity s) {
  switch (s) {
    case Severity::Normal:  return "normal";
    case Severity::Warning: return "warning";
    case Severity::Error:   return "error";
    case Severity::Unknown: return "unknown";
  }
  return "unknown";
}

inline constexpr std::string_view kCheckFailed = "check failed";

struct Verdict {
  Severity severity{Severity::Unknown};
  uint32_t error_count{};
  uint32_t warning_count{};
  uint32_t ok_count{};
  std::string summary{kCheckFailed};
  std::chrono::system_clock::time_point observed_at{};
};

} // namespace mapwatch::model
