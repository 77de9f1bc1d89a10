#include "app/Classifier.hpp"
#include "util/Color.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <charconv>
#include <optional>

namespace mapwatch::app {

using model::Severity;
using model::Verdict;

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Positive decimal label, or 0 when the text is not one. Oversized labels saturate.
static uint64_t numeric_label(std::string_view text) {
  auto t = trim(text);
  if (t.empty()) return 0;
  for (char c : t)
    if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
  if (ec == std::errc::result_out_of_range) return UINT32_MAX;
  if (ec != std::errc{} || ptr != t.data() + t.size()) return 0;
  return v;
}

uint32_t count_indicators(const std::vector<const util::MarkupElement*>& indicators) {
  uint64_t total = 0;
  for (const auto* el : indicators) {
    total += std::min<uint64_t>(numeric_label(el->text), UINT32_MAX);
    if (total >= UINT32_MAX) return UINT32_MAX;
  }
  // No usable badge: one element per problem
  if (total == 0) return static_cast<uint32_t>(indicators.size());
  return static_cast<uint32_t>(total);
}

StatusClassifier::StatusClassifier(ClassifierRules rules) : rules_(std::move(rules)) {
  for (auto* c : {&rules_.error_color, &rules_.warning_color, &rules_.normal_color}) {
    if (auto norm = util::normalize_color(*c)) *c = *norm;
  }
}

Verdict StatusClassifier::failed() {
  Verdict v;
  v.severity = Severity::Unknown;
  v.summary = std::string(model::kCheckFailed);
  v.observed_at = std::chrono::system_clock::now();
  return v;
}

std::string StatusClassifier::summarize(const Verdict& v) {
  switch (v.severity) {
    case Severity::Error:
      return "error (" + std::to_string(v.error_count) + ")";
    case Severity::Warning:
      return "warning (" + std::to_string(v.warning_count) + "), ok (" + std::to_string(v.ok_count) + ")";
    case Severity::Normal:
      return "normal (" + std::to_string(v.ok_count) + " ok)";
    case Severity::Unknown:
      break;
  }
  return std::string(model::kCheckFailed);
}

StatusClassifier::Buckets StatusClassifier::by_class(const std::vector<util::MarkupElement>& els) const {
  Buckets b;
  b.errors = util::select_by_class(els, rules_.error_class);
  b.warnings = util::select_by_class(els, rules_.warning_class);
  b.oks = util::select_by_class(els, rules_.ok_class);
  return b;
}

StatusClassifier::Buckets StatusClassifier::by_color(const std::vector<util::MarkupElement>& els) const {
  Buckets b;
  for (const auto* el : util::select_by_class(els, rules_.swatch_class)) {
    std::optional<std::string> raw;
    if (const auto* style = el->attr("style")) {
      raw = util::style_property(*style, "background-color");
      if (!raw) raw = util::style_property(*style, "color");
    }
    if (!raw) {
      if (const auto* dc = el->attr("data-color")) raw = *dc;
    }
    if (!raw) continue;
    auto color = util::normalize_color(*raw);
    if (!color) continue;
    if (*color == rules_.error_color) b.errors.push_back(el);
    else if (*color == rules_.warning_color) b.warnings.push_back(el);
    else if (*color == rules_.normal_color) b.oks.push_back(el);
  }
  return b;
}

Verdict StatusClassifier::classify(std::string_view fragment) const {
  if (trim(fragment).empty()) return failed();
  auto parsed = util::parse_markup(fragment);
  if (!parsed || parsed->empty()) return failed();

  Buckets b = (rules_.mode == IndicatorMode::Color) ? by_color(*parsed) : by_class(*parsed);

  Verdict v;
  v.observed_at = std::chrono::system_clock::now();
  if (!b.errors.empty()) {
    // Error dominates; warning/ok indicators on the same page are not counted
    v.severity = Severity::Error;
    v.error_count = count_indicators(b.errors);
  } else if (!b.warnings.empty()) {
    v.severity = Severity::Warning;
    v.warning_count = count_indicators(b.warnings);
    v.ok_count = count_indicators(b.oks);
  } else {
    v.severity = Severity::Normal;
    v.ok_count = count_indicators(b.oks);
  }
  v.summary = summarize(v);
  return v;
}

} // namespace mapwatch::app
