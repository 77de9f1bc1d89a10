#pragma once
#include <chrono>
#include <string>

namespace mapwatch::model {

// Outbound notification. Built only on a transition into Error.
struct Alert {
  std::string entity_display_name;
  std::string dashboard_url;
  std::string status_label;
  std::chrono::system_clock::time_point fired_at{};
};

} // namespace mapwatch::model
