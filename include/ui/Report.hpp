#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "app/Monitor.hpp"
#include "model/Entity.hpp"

namespace mapwatch::ui {

// Human-readable progress on stdout
class ConsoleReport {
public:
  explicit ConsoleReport(bool color) : color_(color) {}

  void banner(const std::vector<model::Entity>& entities, bool once) const;
  void cycle_start(uint64_t cycle) const;
  void check(const app::CheckEvent& ev) const;
  void cycle_end(const app::CycleReport& rep, std::chrono::milliseconds next_in, bool once) const;

  [[nodiscard]] std::string format_check(const app::CheckEvent& ev) const;
  [[nodiscard]] std::string format_cycle_end(const app::CycleReport& rep,
                                             std::chrono::milliseconds next_in, bool once) const;

private:
  [[nodiscard]] std::string paint(const char* code, const std::string& text) const;
  bool color_;
};

} // namespace mapwatch::ui
