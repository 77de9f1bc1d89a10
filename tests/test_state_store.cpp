#include "minitest.hpp"
#include "app/StateStore.hpp"

using mapwatch::app::EntityStateStore;
using mapwatch::app::evaluate_transition;
using mapwatch::model::Severity;

TEST(transition_first_error_alerts) {
  auto t = evaluate_transition(std::nullopt, Severity::Error);
  ASSERT_TRUE(t.alert);
  ASSERT_TRUE(t.commit == Severity::Error);
}

TEST(transition_repeat_error_suppressed) {
  auto t = evaluate_transition(Severity::Error, Severity::Error);
  ASSERT_TRUE(!t.alert);
  ASSERT_TRUE(t.commit == Severity::Error);
}

TEST(transition_from_normal_or_warning_alerts) {
  ASSERT_TRUE(evaluate_transition(Severity::Normal, Severity::Error).alert);
  ASSERT_TRUE(evaluate_transition(Severity::Warning, Severity::Error).alert);
}

TEST(transition_unknown_is_inert) {
  for (auto prev : {std::optional<Severity>{}, std::optional<Severity>{Severity::Error},
                    std::optional<Severity>{Severity::Normal}}) {
    auto t = evaluate_transition(prev, Severity::Unknown);
    ASSERT_TRUE(!t.alert);
    ASSERT_TRUE(!t.commit.has_value());
  }
}

TEST(transition_warning_never_alerts) {
  auto t = evaluate_transition(std::nullopt, Severity::Warning);
  ASSERT_TRUE(!t.alert);
  ASSERT_TRUE(t.commit == Severity::Warning);
  ASSERT_TRUE(!evaluate_transition(Severity::Error, Severity::Warning).alert);
}

TEST(store_lazy_entries_and_unknown_ignored) {
  EntityStateStore s;
  ASSERT_TRUE(!s.get("x").has_value());
  s.set("x", Severity::Unknown);
  ASSERT_EQ(s.size(), 0u);
  s.set("x", Severity::Normal);
  s.set("y", Severity::Error);
  ASSERT_EQ(s.size(), 2u);
  ASSERT_TRUE(s.get("x") == Severity::Normal);
  s.set("x", Severity::Unknown);
  ASSERT_TRUE(s.get("x") == Severity::Normal);
}

TEST(store_transition_does_not_commit) {
  EntityStateStore s;
  mapwatch::model::Verdict v;
  v.severity = Severity::Error;
  auto t = s.transition("x", v);
  ASSERT_TRUE(t.alert);
  ASSERT_TRUE(!s.get("x").has_value());
  s.set("x", *t.commit);
  ASSERT_TRUE(!s.transition("x", v).alert);
}
