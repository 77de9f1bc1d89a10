#pragma once
#include "model/Verdict.hpp"
#include "util/Markup.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace mapwatch::app {

enum class IndicatorMode { Class, Color };

struct ClassifierRules {
  IndicatorMode mode = IndicatorMode::Class;
  // Class mode: PRTG map status badges
  std::string error_class   = "sensr";
  std::string warning_class = "sensy";
  std::string ok_class      = "sensg";
  // Color mode: swatches carrying swatch_class, compared by normalized color
  std::string swatch_class  = "mapswatch";
  std::string error_color   = "#e30613";
  std::string warning_color = "#ffcb05";
  std::string normal_color  = "#b4cc38";
};

// Sum of the positive integer labels of a set of indicators, saturating at
// UINT32_MAX. When no indicator carries one, the number of indicators.
[[nodiscard]] uint32_t count_indicators(const std::vector<const util::MarkupElement*>& indicators);

class StatusClassifier {
public:
  explicit StatusClassifier(ClassifierRules rules = {});

  // Verdict for one fetched fragment. Malformed markup yields Unknown, never Normal.
  [[nodiscard]] model::Verdict classify(std::string_view fragment) const;

  // Verdict for a check that never produced a fragment.
  [[nodiscard]] static model::Verdict failed();

  [[nodiscard]] static std::string summarize(const model::Verdict& v);

  [[nodiscard]] const ClassifierRules& rules() const { return rules_; }

private:
  struct Buckets {
    std::vector<const util::MarkupElement*> errors, warnings, oks;
  };
  [[nodiscard]] Buckets by_class(const std::vector<util::MarkupElement>& els) const;
  [[nodiscard]] Buckets by_color(const std::vector<util::MarkupElement>& els) const;

  ClassifierRules rules_;
};

} // namespace mapwatch::app
