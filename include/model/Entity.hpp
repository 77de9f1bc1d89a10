#pragma once
#include <string>

namespace mapwatch::model {

// One monitored dashboard. Built from config at startup, never mutated.
struct Entity {
  std::string id;            // stable key for state tracking (PRTG map id)
  std::string display_name;
  std::string dashboard_ref; // locator handed to the session; defaults to id
};

} // namespace mapwatch::model
