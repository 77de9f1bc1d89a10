#include "app/StateStore.hpp"

namespace mapwatch::app {

using model::Severity;

Transition evaluate_transition(std::optional<Severity> previous, Severity current) {
  Transition t;
  switch (current) {
    case Severity::Unknown:
      // transient failure: keep history as is
      break;
    case Severity::Error:
      t.alert = !previous || *previous != Severity::Error;
      t.commit = Severity::Error;
      break;
    case Severity::Normal:
    case Severity::Warning:
      t.commit = current;
      break;
  }
  return t;
}

std::optional<Severity> EntityStateStore::get(const std::string& entity_id) const {
  auto it = states_.find(entity_id);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

void EntityStateStore::set(const std::string& entity_id, Severity severity) {
  // Unknown is never a stored state
  if (severity == Severity::Unknown) return;
  states_[entity_id] = severity;
}

Transition EntityStateStore::transition(const std::string& entity_id, const model::Verdict& current) const {
  return evaluate_transition(get(entity_id), current.severity);
}

} // namespace mapwatch::app
