#include "util/Markup.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace mapwatch::util {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string lower_copy(std::string_view sv) {
  std::string s(sv);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return sv;
}

static bool is_void_tag(std::string_view tag) {
  static constexpr std::string_view voids[] = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr",
  };
  return std::find(std::begin(voids), std::end(voids), tag) != std::end(voids);
}

static void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) { out += static_cast<char>(cp); }
  else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string decode_entities(std::string_view sv) {
  std::string out;
  out.reserve(sv.size());
  for (size_t i = 0; i < sv.size(); ++i) {
    if (sv[i] != '&') { out += sv[i]; continue; }
    auto semi = sv.find(';', i);
    if (semi == std::string_view::npos || semi - i > 10) { out += '&'; continue; }
    auto name = sv.substr(i + 1, semi - i - 1);
    if (name == "amp") out += '&';
    else if (name == "lt") out += '<';
    else if (name == "gt") out += '>';
    else if (name == "quot") out += '"';
    else if (name == "apos") out += '\'';
    else if (name == "nbsp") out += ' ';
    else if (name.size() > 1 && name[0] == '#') {
      uint32_t cp = 0;
      bool hex = (name[1] == 'x' || name[1] == 'X');
      auto digits = name.substr(hex ? 2 : 1);
      auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
      if (ec != std::errc{} || ptr != digits.data() + digits.size()) { out += '&'; continue; }
      append_utf8(out, cp);
    } else { out += '&'; continue; }
    i = semi;
  }
  return out;
}

const std::string* MarkupElement::attr(std::string_view name) const {
  for (const auto& [k, v] : attrs)
    if (k == name) return &v;
  return nullptr;
}

bool MarkupElement::has_class(std::string_view cls) const {
  const auto* c = attr("class");
  if (!c || cls.empty()) return false;
  std::string_view rest(*c);
  while (!rest.empty()) {
    while (!rest.empty() && is_space(rest.front())) rest.remove_prefix(1);
    size_t n = 0;
    while (n < rest.size() && !is_space(rest[n])) ++n;
    if (rest.substr(0, n) == cls) return true;
    rest.remove_prefix(n);
  }
  return false;
}

namespace {

struct Scanner {
  std::string_view src;
  size_t pos{0};
  std::vector<MarkupElement> out;
  std::vector<std::pair<std::string, size_t>> open; // tag, index into out

  void add_text(std::string_view raw) {
    if (open.empty() || raw.empty()) return;
    auto text = decode_entities(raw);
    for (const auto& [tag, idx] : open) out[idx].text += text;
  }

  void close(std::string_view tag) {
    for (size_t i = open.size(); i-- > 0;) {
      if (open[i].first == tag) { open.resize(i); return; }
    }
    // stray close tag: ignored
  }

  // Parses the attribute section of a start tag: [begin, end) excludes '<tag' and '>'
  static void parse_attrs(std::string_view s, MarkupElement& el) {
    size_t i = 0;
    while (i < s.size()) {
      while (i < s.size() && (is_space(s[i]) || s[i] == '/')) ++i;
      size_t ns = i;
      while (i < s.size() && !is_space(s[i]) && s[i] != '=' && s[i] != '/') ++i;
      if (i == ns) { ++i; continue; }
      std::string name = lower_copy(s.substr(ns, i - ns));
      while (i < s.size() && is_space(s[i])) ++i;
      std::string value;
      if (i < s.size() && s[i] == '=') {
        ++i;
        while (i < s.size() && is_space(s[i])) ++i;
        if (i < s.size() && (s[i] == '"' || s[i] == '\'')) {
          char q = s[i++];
          size_t vs = i;
          while (i < s.size() && s[i] != q) ++i;
          value = decode_entities(s.substr(vs, i - vs));
          if (i < s.size()) ++i;
        } else {
          size_t vs = i;
          while (i < s.size() && !is_space(s[i])) ++i;
          value = decode_entities(s.substr(vs, i - vs));
        }
      }
      el.attrs.emplace_back(std::move(name), std::move(value));
    }
  }

  // Finds the '>' closing a start tag, honoring quoted attribute values.
  [[nodiscard]] size_t tag_end(size_t from) const {
    char q = 0;
    for (size_t i = from; i < src.size(); ++i) {
      char c = src[i];
      if (q) { if (c == q) q = 0; continue; }
      if (c == '"' || c == '\'') { q = c; continue; }
      if (c == '>') return i;
    }
    return std::string_view::npos;
  }

  bool run() {
    while (pos < src.size()) {
      auto lt = src.find('<', pos);
      if (lt == std::string_view::npos) { add_text(src.substr(pos)); break; }
      add_text(src.substr(pos, lt - pos));
      pos = lt;
      if (pos + 1 >= src.size()) { add_text("<"); ++pos; break; }
      char next = src[pos + 1];

      if (src.substr(pos, 4) == "<!--") {
        auto end = src.find("-->", pos + 4);
        if (end == std::string_view::npos) return false;
        pos = end + 3;
        continue;
      }
      if (next == '!' || next == '?') {
        auto end = src.find('>', pos);
        if (end == std::string_view::npos) return false;
        pos = end + 1;
        continue;
      }
      if (next == '/') {
        auto end = src.find('>', pos);
        if (end == std::string_view::npos) return false;
        auto name = lower_copy(trim(src.substr(pos + 2, end - pos - 2)));
        close(name);
        pos = end + 1;
        continue;
      }
      if (!std::isalpha(static_cast<unsigned char>(next))) {
        // a bare '<' in text
        add_text("<");
        ++pos;
        continue;
      }

      auto end = tag_end(pos + 1);
      if (end == std::string_view::npos) return false;
      size_t ns = pos + 1;
      size_t ne = ns;
      while (ne < end && !is_space(src[ne]) && src[ne] != '/') ++ne;
      MarkupElement el;
      el.tag = lower_copy(src.substr(ns, ne - ns));
      parse_attrs(src.substr(ne, end - ne), el);
      bool self_closing = end > ns && src[end - 1] == '/';
      std::string tag = el.tag;
      out.push_back(std::move(el));
      pos = end + 1;

      if (tag == "script" || tag == "style") {
        auto close_at = lower_copy(src.substr(pos)).find("</" + tag);
        if (close_at == std::string::npos) return false;
        pos += close_at;
        auto gt = src.find('>', pos);
        if (gt == std::string_view::npos) return false;
        pos = gt + 1;
        continue;
      }
      if (!self_closing && !is_void_tag(tag)) open.emplace_back(std::move(tag), out.size() - 1);
    }
    return true;
  }
};

} // namespace

std::optional<std::vector<MarkupElement>> parse_markup(std::string_view html) {
  Scanner sc{html};
  if (!sc.run()) return std::nullopt;
  return std::move(sc.out);
}

std::vector<const MarkupElement*> select_by_class(const std::vector<MarkupElement>& elements,
                                                  std::string_view cls) {
  std::vector<const MarkupElement*> hits;
  for (const auto& el : elements)
    if (el.has_class(cls)) hits.push_back(&el);
  return hits;
}

std::optional<std::string> style_property(std::string_view style, std::string_view property) {
  std::string want = lower_copy(property);
  while (!style.empty()) {
    auto semi = style.find(';');
    auto decl = style.substr(0, semi);
    style = (semi == std::string_view::npos) ? std::string_view{} : style.substr(semi + 1);
    auto colon = decl.find(':');
    if (colon == std::string_view::npos) continue;
    if (lower_copy(trim(decl.substr(0, colon))) != want) continue;
    auto value = trim(decl.substr(colon + 1));
    if (value.ends_with("!important")) value = trim(value.substr(0, value.size() - 10));
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace mapwatch::util
