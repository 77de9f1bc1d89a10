#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mapwatch::util {

// Parse "#rrggbb" (either case) into channels. False on any other shape.
bool parse_hex_rgb(std::string_view hex, int& r, int& g, int& b);

// Canonical lowercase "#rrggbb" for a CSS color value.
// Accepts "#rgb", "#rrggbb", "rgb(r, g, b)" and "rgba(r, g, b, a)"; alpha is dropped
// and channels are clamped to 0..255. nullopt for anything else.
[[nodiscard]] std::optional<std::string> normalize_color(std::string_view css);

} // namespace mapwatch::util
