#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace mapwatch::util {

// Minimal TOML subset: [section], [[array-of-tables]], key = value,
// quoted strings, integers, booleans and single-line string arrays.
class TomlReader {
private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

public:
  // Read-only view of one [[name]] entry
  class Table {
  public:
    explicit Table(const Section* s) : s_(s) {}
    [[nodiscard]] std::string get_string(std::string_view key, const std::string& def = "") const {
      return s_->get(key, def);
    }
    [[nodiscard]] int get_int(std::string_view key, int def = 0) const { return to_int(s_->get(key, ""), def); }
    [[nodiscard]] bool get_bool(std::string_view key, bool def = false) const { return to_bool(s_->get(key, ""), def); }
    [[nodiscard]] bool has(std::string_view key) const { return s_->has(key); }
  private:
    const Section* s_;
  };

  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    Section* current = &ensure_section("");
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.size() >= 4 && sv.starts_with("[[") && sv.ends_with("]]")) {
        std::string name(trim(sv.substr(2, sv.size() - 4)));
        sections_.push_back(Named{name, Section{}, true});
        current = &sections_.back().section;
        continue;
      }
      if (sv.front() == '[' && sv.back() == ']') {
        std::string name(trim(sv.substr(1, sv.size() - 2)));
        current = &ensure_section(name);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = unescape(std::string_view(val).substr(1, val.size() - 2));
      current->set(key, val);
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& n : sections_) {
      if (n.name.empty() && n.section.entries.empty()) continue;
      if (!first) out << '\n';
      first = false;
      if (n.array) out << "[[" << n.name << "]]\n";
      else if (!n.name.empty()) out << '[' << n.name << "]\n";
      for (const auto& [k, v] : n.section.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << escape(v) << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    return s ? to_int(s->get(key, ""), def) : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    return s ? to_bool(s->get(key, ""), def) : def;
  }

  // ["a", "b"] -> {a, b}. A bare string is treated as a one-element list.
  [[nodiscard]] std::vector<std::string> get_string_list(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return {};
    return split_list(s->get(key, ""));
  }

  // All [[name]] tables in file order
  [[nodiscard]] std::vector<Table> tables(std::string_view name) const {
    std::vector<Table> out;
    for (const auto& n : sections_)
      if (n.array && n.name == name) out.emplace_back(&n.section);
    return out;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Named {
    std::string name;
    Section section;
    bool array{false};
  };

  std::vector<Named> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& n : sections_)
      if (!n.array && n.name == name) return n.section;
    sections_.push_back(Named{name, Section{}, false});
    return sections_.back().section;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& n : sections_)
      if (!n.array && n.name == name) return &n.section;
    return nullptr;
  }

  static int to_int(const std::string& val, int def) {
    if (val.empty()) return def;
    try { return std::stoi(val); } catch (...) { return def; }
  }

  static bool to_bool(const std::string& val, bool def) {
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  static std::string unescape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '\\' && i + 1 < sv.size()) {
        char n = sv[++i];
        if (n == 'n') out += '\n';
        else if (n == 't') out += '\t';
        else out += n; // \" and \\ and anything unknown
      } else {
        out += sv[i];
      }
    }
    return out;
  }

  static std::string escape(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
      if (c == '"' || c == '\\') out += '\\';
      if (c == '\n') { out += "\\n"; continue; }
      out += c;
    }
    return out;
  }

  static std::vector<std::string> split_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string_view sv = trim(raw);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') {
      sv = sv.substr(1, sv.size() - 2);
    } else {
      if (!sv.empty()) out.emplace_back(sv);
      return out;
    }
    while (!sv.empty()) {
      sv = trim(sv);
      if (sv.empty()) break;
      std::string item;
      if (sv.front() == '"') {
        auto close = sv.find('"', 1);
        if (close == std::string_view::npos) close = sv.size();
        item = std::string(sv.substr(1, close - 1));
        sv.remove_prefix(std::min(close + 1, sv.size()));
      } else {
        auto comma = sv.find(',');
        item = std::string(trim(sv.substr(0, comma)));
        sv.remove_prefix(comma == std::string_view::npos ? sv.size() : comma);
      }
      if (!item.empty()) out.push_back(std::move(item));
      sv = trim(sv);
      if (!sv.empty() && sv.front() == ',') sv.remove_prefix(1);
    }
    return out;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    if (val.front() == '[' && val.back() == ']') return false;
    // Check if it's a pure integer
    size_t start = (val[0] == '-') ? 1 : 0;
    bool all_digits = (start < val.size());
    for (size_t i = start; i < val.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(val[i]))) { all_digits = false; break; }
    }
    if (all_digits) return false;
    // Everything else is a string that needs quoting
    return true;
  }
};

} // namespace mapwatch::util
