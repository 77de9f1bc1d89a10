#include "minitest.hpp"
#include "ui/Report.hpp"
#include <string>

using namespace mapwatch;

static app::CheckEvent event(const model::Entity& e, model::Severity s, const char* summary) {
  app::CheckEvent ev;
  ev.entity = &e;
  ev.verdict.severity = s;
  ev.verdict.summary = summary;
  return ev;
}

TEST(report_plain_check_lines) {
  ui::ConsoleReport r(false);
  model::Entity e{"core", "Core", "1"};
  auto ok = r.format_check(event(e, model::Severity::Normal, "normal (4 ok)"));
  ASSERT_EQ(ok, "OK    [Core] normal (4 ok)");

  auto err = event(e, model::Severity::Error, "error (2)");
  err.alerted = true;
  err.delivered = app::DeliveryStatus::Sent;
  ASSERT_EQ(r.format_check(err), "ALERT [Core] error (2) - alert sent");

  err.delivered.reset();
  err.delivery_failure = "transport failure: smtp down";
  ASSERT_EQ(r.format_check(err), "ALERT [Core] error (2) - alert failed: transport failure: smtp down");

  auto unk = event(e, model::Severity::Unknown, "check failed");
  unk.failure = "timeout";
  ASSERT_EQ(r.format_check(unk), "?     [Core] check failed (timeout)");
}

TEST(report_color_wraps_line) {
  ui::ConsoleReport r(true);
  model::Entity e{"core", "Core", "1"};
  auto s = r.format_check(event(e, model::Severity::Error, "error (1)"));
  ASSERT_TRUE(s.starts_with("\x1B[31m"));
  ASSERT_TRUE(s.ends_with("\x1B[0m"));
}

TEST(report_cycle_summary) {
  ui::ConsoleReport r(false);
  app::CycleReport rep;
  rep.checked = 3;
  rep.errors = 1;
  rep.alerts_fired = 1;
  auto line = r.format_cycle_end(rep, std::chrono::seconds(60), false);
  ASSERT_EQ(line, "checked 3, errors 1, unknown 0, alerts 1 sent / 0 failed; next check in 60s");
  ASSERT_TRUE(r.format_cycle_end(rep, std::chrono::seconds(60), true).find("next check") == std::string::npos);
  rep.cancelled = true;
  ASSERT_TRUE(r.format_cycle_end(rep, std::chrono::seconds(60), false).ends_with("; interrupted"));
}
