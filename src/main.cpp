#include "app/Config.hpp"
#include "app/LogWriter.hpp"
#include "app/MailSink.hpp"
#include "app/MetricsServer.hpp"
#include "app/Monitor.hpp"
#include "app/StatusBoard.hpp"
#include "collectors/PrtgGateway.hpp"
#include "ui/Report.hpp"
#include "ui/Terminal.hpp"
#include "util/Curl.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace std::chrono_literals;
namespace util = mapwatch::util;

namespace {

struct CliOptions {
  std::string config_path;
  bool once{false};
  bool test_mail{false};
  std::optional<long> interval_s;
  std::optional<std::string> log_dir;
  std::optional<long> metrics_port;
};

void print_usage() {
  std::printf("Usage: mapwatch [-c FILE] [--once|--test] [--interval S] [--log-dir DIR]\n"
              "                [--metrics-port PORT] [--test-mail]\n"
              "  -c, --config FILE    config file (default %s)\n"
              "  -t, --once, --test   run one check cycle and exit\n"
              "  --interval S         seconds between cycles (overrides config)\n"
              "  --log-dir DIR        write hourly check history under DIR\n"
              "  --metrics-port PORT  serve Prometheus metrics on PORT (0 disables)\n"
              "  --test-mail          send one test alert and exit\n",
              mapwatch::app::default_config_path().c_str());
}

std::optional<long> parse_long(std::string_view s) {
  long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

// 0 = parsed, 1 = bad usage, 2 = help printed
int parse_args(int argc, char** argv, CliOptions& cli) {
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto value = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "mapwatch: %s needs a value\n", flag);
        return nullptr;
      }
      return argv[++i];
    };
    if (a == "-c" || a == "--config") {
      const char* v = value("--config"); if (!v) return 1;
      cli.config_path = v;
    } else if (a == "-t" || a == "--once" || a == "--test") {
      cli.once = true;
    } else if (a == "--test-mail") {
      cli.test_mail = true;
    } else if (a == "--interval") {
      const char* v = value("--interval"); if (!v) return 1;
      cli.interval_s = parse_long(v);
      if (!cli.interval_s || *cli.interval_s <= 0) {
        std::fprintf(stderr, "mapwatch: --interval must be a positive number of seconds\n");
        return 1;
      }
    } else if (a == "--log-dir") {
      const char* v = value("--log-dir"); if (!v) return 1;
      cli.log_dir = v;
    } else if (a == "--metrics-port") {
      const char* v = value("--metrics-port"); if (!v) return 1;
      cli.metrics_port = parse_long(v);
      if (!cli.metrics_port || *cli.metrics_port < 0 || *cli.metrics_port > 65535) {
        std::fprintf(stderr, "mapwatch: --metrics-port must be 0..65535\n");
        return 1;
      }
    } else if (a == "-h" || a == "--help") {
      print_usage();
      return 2;
    } else {
      std::fprintf(stderr, "mapwatch: unknown argument '%s'\n", argv[i]);
      print_usage();
      return 1;
    }
  }
  return 0;
}

int send_test_mail(const mapwatch::app::MonitorConfig& cfg) {
  mapwatch::app::MailSink sink(cfg.mail);
  if (!sink.enabled()) {
    util::log(util::LogLevel::Error, "test mail: [smtp] server and [email] recipients must be set");
    return 1;
  }
  const auto& first = cfg.entities.front();
  mapwatch::model::Alert alert;
  alert.entity_display_name = "mapwatch test (" + first.display_name + ")";
  alert.dashboard_url = mapwatch::collectors::prtg_dashboard_url(cfg.prtg.base_url, first.dashboard_ref);
  alert.status_label = "test message, no action required";
  alert.fired_at = std::chrono::system_clock::now();

  std::stop_source never;
  auto res = sink.deliver(alert, never.get_token());
  if (!res) {
    util::log(util::LogLevel::Error, "test mail: %s: %s", mapwatch::app::describe(res.error().kind), res.error().detail.c_str());
    return 1;
  }
  util::log(util::LogLevel::Info, "test mail: sent to %zu recipient(s)", cfg.mail.recipients.size());
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions cli;
  if (int rc = parse_args(argc, argv, cli); rc != 0) return rc == 2 ? 0 : 1;
  if (cli.config_path.empty()) cli.config_path = mapwatch::app::default_config_path();

  auto loaded = mapwatch::app::load_config(cli.config_path);
  if (!loaded) {
    util::log(util::LogLevel::Error, "config: %s: %s", mapwatch::app::describe(loaded.error().kind), loaded.error().detail.c_str());
    return 1;
  }
  mapwatch::app::MonitorConfig cfg = std::move(*loaded);
  if (cli.interval_s) cfg.monitor.interval = std::chrono::seconds(*cli.interval_s);
  if (cli.log_dir) cfg.log_dir = *cli.log_dir;
  if (cli.metrics_port) cfg.metrics_port = static_cast<uint16_t>(*cli.metrics_port);

  util::CurlGlobal curl;
  if (!curl.ok()) {
    util::log(util::LogLevel::Error, "curl_global_init failed");
    return 1;
  }

  if (cli.test_mail) return send_test_mail(cfg);

  mapwatch::ui::install_signal_handlers();

  mapwatch::app::StatusBoard board;
  mapwatch::collectors::PrtgGateway gateway(cfg.prtg);
  mapwatch::app::MailSink sink(cfg.mail);
  if (!sink.enabled()) util::log(util::LogLevel::Warn, "mail: no SMTP server or recipients configured, alerts are logged only");

  mapwatch::app::Monitor monitor(cfg.entities, gateway, sink, mapwatch::app::StatusClassifier(cfg.rules),
                                 cfg.monitor, &board);

  mapwatch::ui::ConsoleReport report(mapwatch::ui::color_stdout());
  monitor.on_cycle_start([&](uint64_t cycle){ report.cycle_start(cycle); });
  monitor.on_check([&](const mapwatch::app::CheckEvent& ev){ report.check(ev); });
  const auto interval = cfg.monitor.interval;
  const bool once = cli.once;
  monitor.on_cycle([&, interval, once](const mapwatch::app::CycleReport& rep){ report.cycle_end(rep, interval, once); });

  std::unique_ptr<mapwatch::app::LogWriter> history;
  if (!cfg.log_dir.empty()) {
    history = std::make_unique<mapwatch::app::LogWriter>(cfg.log_dir);
    monitor.on_check([w = history.get()](const mapwatch::app::CheckEvent& ev){ w->write(ev); });
  }

  std::unique_ptr<mapwatch::app::MetricsServer> metrics;
  if (cfg.metrics_port != 0) {
    metrics = std::make_unique<mapwatch::app::MetricsServer>(board, cfg.metrics_port, cfg.metrics_bind);
    if (auto bound = metrics->start(); !bound) {
      util::log(util::LogLevel::Warn, "metrics: %s", bound.error().c_str());
      metrics.reset();
    }
  }

  report.banner(monitor.entities(), once);
  monitor.start(once);
  while (!monitor.finished()) {
    if (mapwatch::ui::g_stop.load()) {
      util::log(util::LogLevel::Info, "signal received, stopping");
      monitor.stop();
      break;
    }
    std::this_thread::sleep_for(100ms);
  }
  monitor.stop();
  if (metrics) metrics->stop();

  auto outcome = monitor.outcome().value_or(mapwatch::app::RunOutcome::Stopped);
  util::log(util::LogLevel::Info, "monitor %s", mapwatch::app::describe(outcome));
  switch (outcome) {
    case mapwatch::app::RunOutcome::AuthFailed:
    case mapwatch::app::RunOutcome::ChecksFailed:
    case mapwatch::app::RunOutcome::Failed:
      return 1;
    case mapwatch::app::RunOutcome::Stopped:
    case mapwatch::app::RunOutcome::Completed:
      return 0;
  }
  return 0;
}
