#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "app/Monitor.hpp"

namespace mapwatch::app {

// Check history: one line per entity check, appended to hourly files
// <log_dir>/mapwatch_YYYY-MM-DD_HH.log. Called from the monitor worker.
class LogWriter {
public:
  explicit LogWriter(std::filesystem::path log_dir);
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void write(const CheckEvent& ev);

  [[nodiscard]] static std::string format_line(const CheckEvent& ev);
  [[nodiscard]] std::filesystem::path chunk_path(std::chrono::system_clock::time_point tp) const;

private:
  std::filesystem::path log_dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
};

} // namespace mapwatch::app
