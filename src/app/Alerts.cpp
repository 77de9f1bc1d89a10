#include "app/Alerts.hpp"

namespace mapwatch::app {

const char* describe(DeliveryError::Kind k) {
  switch (k) {
    case DeliveryError::Kind::Transport: return "transport failure";
    case DeliveryError::Kind::Auth:      return "authentication failure";
    case DeliveryError::Kind::Cancelled: return "cancelled";
  }
  return "delivery error";
}

model::Alert make_alert(const model::Entity& entity, const model::Verdict& verdict,
                        std::string dashboard_url) {
  model::Alert a;
  a.entity_display_name = entity.display_name.empty() ? entity.id : entity.display_name;
  a.dashboard_url = std::move(dashboard_url);
  a.status_label = verdict.summary;
  a.fired_at = std::chrono::system_clock::now();
  return a;
}

} // namespace mapwatch::app
