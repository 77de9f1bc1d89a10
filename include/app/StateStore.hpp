#pragma once
#include "model/Verdict.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace mapwatch::app {

// Outcome of evaluating one verdict against the stored severity
struct Transition {
  bool alert{false};                        // qualifying edge into Error
  std::optional<model::Severity> commit{};  // severity to store; empty = leave untouched
};

// Edge-triggered debounce: only a non-Error -> Error edge alerts (first
// observation included). Unknown never alerts and never touches state.
[[nodiscard]] Transition evaluate_transition(std::optional<model::Severity> previous,
                                             model::Severity current);

// Last observed severity per entity. Entries appear on first observation and
// live for the process lifetime. Written only by the monitor worker.
class EntityStateStore {
public:
  [[nodiscard]] std::optional<model::Severity> get(const std::string& entity_id) const;
  void set(const std::string& entity_id, model::Severity severity);

  // Evaluates the verdict against the stored state. The caller delivers the
  // alert (if any) and then commits via set(); see Monitor::check_entity.
  [[nodiscard]] Transition transition(const std::string& entity_id, const model::Verdict& current) const;

  [[nodiscard]] size_t size() const { return states_.size(); }

private:
  std::unordered_map<std::string, model::Severity> states_;
};

} // namespace mapwatch::app
