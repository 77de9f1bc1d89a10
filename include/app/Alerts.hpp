#pragma once
#include "model/Alert.hpp"
#include "model/Entity.hpp"
#include "model/Verdict.hpp"
#include <expected>
#include <stop_token>
#include <string>

namespace mapwatch::app {

enum class DeliveryStatus { Sent, Disabled };

struct DeliveryError {
  enum class Kind { Transport, Auth, Cancelled };
  Kind kind{Kind::Transport};
  std::string detail;
};

[[nodiscard]] const char* describe(DeliveryError::Kind k);

// Notification channel. "Nothing configured" is Disabled, not an error.
class IAlertSink {
public:
  virtual ~IAlertSink() = default;
  [[nodiscard]] virtual auto deliver(const model::Alert& alert, std::stop_token st)
      -> std::expected<DeliveryStatus, DeliveryError> = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

[[nodiscard]] model::Alert make_alert(const model::Entity& entity, const model::Verdict& verdict,
                                      std::string dashboard_url);

} // namespace mapwatch::app
