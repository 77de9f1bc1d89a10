#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mapwatch::util {

struct MarkupElement {
  std::string tag;                                          // lowercase
  std::vector<std::pair<std::string, std::string>> attrs;   // names lowercase, values entity-decoded
  std::string text;                                         // text content incl. descendants

  [[nodiscard]] const std::string* attr(std::string_view name) const;
  [[nodiscard]] bool has_class(std::string_view cls) const;
};

// Tolerant HTML scan into a flat, document-ordered element list.
// Unclosed elements are fine; a tag or comment cut off before its '>' is not
// and yields nullopt. Contents of <script> and <style> are skipped.
[[nodiscard]] std::optional<std::vector<MarkupElement>> parse_markup(std::string_view html);

// Elements whose class attribute contains cls as a whole word.
[[nodiscard]] std::vector<const MarkupElement*> select_by_class(const std::vector<MarkupElement>& elements,
                                                               std::string_view cls);

// Value of one declaration in an inline style ("background-color: #fff; ...").
[[nodiscard]] std::optional<std::string> style_property(std::string_view style, std::string_view property);

[[nodiscard]] std::string decode_entities(std::string_view sv);

} // namespace mapwatch::util
