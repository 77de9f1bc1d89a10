#include "app/LogWriter.hpp"
#include "util/Log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace mapwatch::app {

LogWriter::LogWriter(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    util::log(util::LogLevel::Error, "LogWriter: failed to create %s: %s", log_dir_.c_str(), ec.message().c_str());
  } else {
    util::log(util::LogLevel::Info, "LogWriter: writing check history to %s/", log_dir_.c_str());
  }
}

LogWriter::~LogWriter() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

static void append_quoted(std::string& out, const std::string& s) {
  out += '"';
  for (char c : s) {
    if (c == '"' || c == '\\') { out += '\\'; out += c; }
    else if (c == '\n') out += "\\n";
    else out += c;
  }
  out += '"';
}

std::string LogWriter::format_line(const CheckEvent& ev) {
  auto t = std::chrono::system_clock::to_time_t(ev.verdict.observed_at);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%S", &tm);

  std::string line = ts;
  line += " cycle=" + std::to_string(ev.cycle);
  if (ev.entity) {
    line += " entity=";
    append_quoted(line, ev.entity->id);
    line += " name=";
    append_quoted(line, ev.entity->display_name);
  }
  line += " severity=";
  line += model::severity_name(ev.verdict.severity);
  line += " errors=" + std::to_string(ev.verdict.error_count);
  line += " warnings=" + std::to_string(ev.verdict.warning_count);
  line += " ok=" + std::to_string(ev.verdict.ok_count);
  line += " previous=";
  line += ev.previous ? model::severity_name(*ev.previous) : std::string_view("none");
  if (ev.alerted) {
    line += " alert=";
    if (!ev.delivery_failure.empty()) line += "failed";
    else if (ev.delivered == DeliveryStatus::Disabled) line += "disabled";
    else line += "sent";
  }
  line += " summary=";
  append_quoted(line, ev.verdict.summary);
  if (!ev.failure.empty()) {
    line += " failure=";
    append_quoted(line, ev.failure);
  }
  if (!ev.delivery_failure.empty()) {
    line += " delivery=";
    append_quoted(line, ev.delivery_failure);
  }
  return line;
}

void LogWriter::write(const CheckEvent& ev) {
  auto now = std::chrono::system_clock::now();
  auto required_path = chunk_path(now);

  // Rotate on hour boundary
  if (required_path != current_path_) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.open(required_path, std::ios::app);
    if (!file_) {
      util::log(util::LogLevel::Error, "LogWriter: failed to open %s: %s", required_path.c_str(), std::strerror(errno));
      current_path_.clear();
      return;
    }
    current_path_ = required_path;
  }

  std::string line = format_line(ev);
  line += '\n';
  file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  file_.flush();
}

std::filesystem::path LogWriter::chunk_path(std::chrono::system_clock::time_point tp) const {
  auto now_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "mapwatch_%04d-%02d-%02d_%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace mapwatch::app
