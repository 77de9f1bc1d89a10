#include "app/MetricsServer.hpp"
#include <charconv>
#include <chrono>
#include <string_view>

namespace {

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_int(std::string& out, int64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

void emit_gauge_i(std::string& out, const char* name, int64_t value) {
  out += name;  out += ' ';  append_int(out, value);  out += '\n';
}

// name{entity="id",name="display"} value
void emit_entity_u(std::string& out, const char* name, const mapwatch::model::EntityStatus& e, uint64_t value) {
  out += name;  out += "{entity=\"";
  append_escaped(out, e.id);
  out += "\",name=\"";
  append_escaped(out, e.display_name);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

// Severity exported as one series per state, 1 for the current one
void emit_entity_severity(std::string& out, const mapwatch::model::EntityStatus& e) {
  using mapwatch::model::Severity;
  static constexpr Severity kAll[] = {Severity::Normal, Severity::Warning, Severity::Error, Severity::Unknown};
  for (Severity s : kAll) {
    out += "mapwatch_entity_severity{entity=\"";
    append_escaped(out, e.id);
    out += "\",severity=\"";
    out += mapwatch::model::severity_name(s);
    out += "\"} ";
    out += (e.last.severity == s) ? '1' : '0';
    out += '\n';
  }
}

} // anonymous namespace

namespace mapwatch::app {

std::string status_to_prometheus(const model::StatusSnapshot& s) {
  std::string out;
  out.reserve(1024 + s.entities.size() * 512);

  emit_header(out, "mapwatch_up", "1 while a dashboard session is established", "gauge");
  emit_gauge_u(out, "mapwatch_up", s.authenticated ? 1 : 0);
  emit_header(out, "mapwatch_cycles_total", "Completed or attempted check cycles", "counter");
  emit_gauge_u(out, "mapwatch_cycles_total", s.cycle);
  emit_header(out, "mapwatch_entities", "Monitored entities", "gauge");
  emit_gauge_u(out, "mapwatch_entities", s.entities.size());

  if (s.updated_at.time_since_epoch().count() != 0) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(s.updated_at.time_since_epoch()).count();
    emit_header(out, "mapwatch_last_update_timestamp_seconds", "Unix time of the last status publish", "gauge");
    emit_gauge_i(out, "mapwatch_last_update_timestamp_seconds", static_cast<int64_t>(secs));
  }

  if (s.entities.empty()) return out;

  emit_header(out, "mapwatch_entity_severity", "Latest classified severity per entity", "gauge");
  for (const auto& e : s.entities) emit_entity_severity(out, e);

  emit_header(out, "mapwatch_entity_error_count", "Error indicators on the last check", "gauge");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_entity_error_count", e, e.last.error_count);
  emit_header(out, "mapwatch_entity_warning_count", "Warning indicators on the last check", "gauge");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_entity_warning_count", e, e.last.warning_count);
  emit_header(out, "mapwatch_entity_ok_count", "Normal indicators on the last check", "gauge");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_entity_ok_count", e, e.last.ok_count);

  emit_header(out, "mapwatch_checks_total", "Checks performed per entity", "counter");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_checks_total", e, e.checks);
  emit_header(out, "mapwatch_check_failures_total", "Checks that ended Unknown", "counter");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_check_failures_total", e, e.failed_checks);
  emit_header(out, "mapwatch_alerts_fired_total", "Alerts delivered per entity", "counter");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_alerts_fired_total", e, e.alerts_fired);
  emit_header(out, "mapwatch_alerts_failed_total", "Alerts whose delivery failed", "counter");
  for (const auto& e : s.entities) emit_entity_u(out, "mapwatch_alerts_failed_total", e, e.alerts_failed);

  return out;
}

} // namespace mapwatch::app
