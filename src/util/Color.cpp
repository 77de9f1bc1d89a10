#include "util/Color.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace mapwatch::util {

static int hexv(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

static std::string to_hex(int r, int g, int b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                std::clamp(r, 0, 255), std::clamp(g, 0, 255), std::clamp(b, 0, 255));
  return std::string(buf);
}

bool parse_hex_rgb(std::string_view hex, int& r, int& g, int& b) {
  if (hex.size() != 7 || hex[0] != '#') return false;
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

// Reads "( n , n , n" after the function name; anything past the third channel is ignored.
static bool parse_rgb_channels(std::string_view args, int (&ch)[3]) {
  if (args.empty() || args.front() != '(') return false;
  args.remove_prefix(1);
  for (int i = 0; i < 3; ++i) {
    args = trim(args);
    int v = 0;
    auto [ptr, ec] = std::from_chars(args.data(), args.data() + args.size(), v);
    if (ec != std::errc{} || ptr == args.data()) return false;
    ch[i] = v;
    args.remove_prefix(static_cast<size_t>(ptr - args.data()));
    args = trim(args);
    if (i < 2) {
      if (args.empty() || args.front() != ',') return false;
      args.remove_prefix(1);
    }
  }
  return true;
}

std::optional<std::string> normalize_color(std::string_view css) {
  auto sv = trim(css);
  if (sv.empty()) return std::nullopt;

  if (sv.front() == '#') {
    if (sv.size() == 4) {
      int a = hexv(sv[1]), b = hexv(sv[2]), c = hexv(sv[3]);
      if (a < 0 || b < 0 || c < 0) return std::nullopt;
      return to_hex(a * 17, b * 17, c * 17);
    }
    int r, g, b;
    if (!parse_hex_rgb(sv, r, g, b)) return std::nullopt;
    return to_hex(r, g, b);
  }

  std::string lower(sv);
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  std::string_view rest(lower);
  if (rest.starts_with("rgba")) rest.remove_prefix(4);
  else if (rest.starts_with("rgb")) rest.remove_prefix(3);
  else return std::nullopt;

  int ch[3] = {0, 0, 0};
  if (!parse_rgb_channels(trim(rest), ch)) return std::nullopt;
  return to_hex(ch[0], ch[1], ch[2]);
}

} // namespace mapwatch::util
