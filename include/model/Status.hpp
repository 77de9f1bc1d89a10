#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Verdict.hpp"

namespace mapwatch::model {

// Last published view of one entity
struct EntityStatus {
  std::string id;
  std::string display_name;
  std::string dashboard_url;
  Verdict last{};                          // most recent verdict, Unknown included
  std::optional<Severity> stored{};        // debounce state (never Unknown)
  uint64_t checks{};
  uint64_t failed_checks{};
  uint64_t alerts_fired{};
  uint64_t alerts_failed{};
};

struct StatusSnapshot {
  uint64_t seq{};
  uint64_t cycle{};
  bool authenticated{false};
  std::chrono::system_clock::time_point updated_at{};
  std::vector<EntityStatus> entities;
};

} // namespace mapwatch::model
