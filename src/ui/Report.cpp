#include "ui/Report.hpp"
#include "ui/Terminal.hpp"
#include <cstdio>
#include <ctime>

namespace mapwatch::ui {

namespace {
constexpr const char* kRed = "31";
constexpr const char* kGreen = "32";
constexpr const char* kYellow = "33";
constexpr const char* kRule = "==================================================";

std::string clock_now() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}
} // namespace

std::string ConsoleReport::paint(const char* code, const std::string& text) const {
  if (!color_) return text;
  return sgr(code) + text + sgr_reset();
}

void ConsoleReport::banner(const std::vector<model::Entity>& entities, bool once) const {
  std::printf("\n%s\n%s\n%s\n", kRule, once ? "mapwatch: single check" : "mapwatch: monitoring started", kRule);
  std::printf("Targets:\n");
  for (const auto& e : entities) {
    const std::string& name = e.display_name.empty() ? e.id : e.display_name;
    std::printf("  - %s (map %s)\n", name.c_str(), e.dashboard_ref.c_str());
  }
  std::printf("%s\n\n", kRule);
  std::fflush(stdout);
}

void ConsoleReport::cycle_start(uint64_t cycle) const {
  std::printf("\n--- cycle %llu (%s) ---\n", static_cast<unsigned long long>(cycle), clock_now().c_str());
  std::fflush(stdout);
}

std::string ConsoleReport::format_check(const app::CheckEvent& ev) const {
  std::string name;
  if (ev.entity) name = ev.entity->display_name.empty() ? ev.entity->id : ev.entity->display_name;

  std::string line;
  const char* code = kGreen;
  switch (ev.verdict.severity) {
    case model::Severity::Error:   line = "ALERT "; code = kRed; break;
    case model::Severity::Warning: line = "WARN  "; code = kYellow; break;
    case model::Severity::Normal:  line = "OK    "; break;
    case model::Severity::Unknown: line = "?     "; code = kYellow; break;
  }
  line += "[" + name + "] " + ev.verdict.summary;
  if (!ev.failure.empty()) line += " (" + ev.failure + ")";
  if (ev.alerted) {
    if (!ev.delivery_failure.empty()) line += " - alert failed: " + ev.delivery_failure;
    else if (ev.delivered == app::DeliveryStatus::Disabled) line += " - alert not sent (mail disabled)";
    else line += " - alert sent";
  }
  return paint(code, line);
}

void ConsoleReport::check(const app::CheckEvent& ev) const {
  std::printf("%s\n", format_check(ev).c_str());
  std::fflush(stdout);
}

std::string ConsoleReport::format_cycle_end(const app::CycleReport& rep,
                                            std::chrono::milliseconds next_in, bool once) const {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "checked %zu, errors %zu, unknown %zu, alerts %zu sent / %zu failed",
                rep.checked, rep.errors, rep.unknown, rep.alerts_fired, rep.alerts_failed);
  std::string out = buf;
  if (rep.cancelled) {
    out += "; interrupted";
  } else if (!once) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(next_in).count();
    out += "; next check in " + std::to_string(secs) + "s";
  }
  return out;
}

void ConsoleReport::cycle_end(const app::CycleReport& rep, std::chrono::milliseconds next_in, bool once) const {
  std::printf("%s\n", format_cycle_end(rep, next_in, once).c_str());
  if (once) std::printf("\n%s\nmapwatch: check complete\n%s\n", kRule, kRule);
  std::fflush(stdout);
}

} // namespace mapwatch::ui
