#include "app/Config.hpp"
#include "util/Color.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <unordered_set>

namespace mapwatch::app {

const char* describe(ConfigError::Kind k) {
  switch (k) {
    case ConfigError::Kind::Unreadable:     return "unreadable config";
    case ConfigError::Kind::NoEntities:     return "no entities configured";
    case ConfigError::Kind::MissingBaseUrl: return "missing prtg base_url";
    case ConfigError::Kind::BadInterval:    return "bad interval";
    case ConfigError::Kind::BadValue:       return "bad value";
  }
  return "config error";
}

namespace {

// MAPWATCH_X, falling back to the lowercase mapwatch_x spelling
const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  if (n.rfind("MAPWATCH_", 0) == 0) {
    std::string alt = "mapwatch_" + n.substr(9);
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string resolve_string(const util::TomlReader& toml, std::string_view section, std::string_view key,
                           const char* env, const std::string& def) {
  if (toml.has(section, key)) return toml.get_string(section, key, def);
  if (const char* v = getenv_compat(env)) return v;
  return def;
}

// nullopt when a value is present but not an integer
std::optional<long> resolve_int(const util::TomlReader& toml, std::string_view section, std::string_view key,
                                const char* env, long def) {
  std::string raw;
  if (toml.has(section, key)) raw = toml.get_string(section, key);
  else if (const char* v = getenv_compat(env)) raw = v;
  else return def;
  long out = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
  if (ec != std::errc{} || ptr != raw.data() + raw.size()) return std::nullopt;
  return out;
}

bool resolve_bool(const util::TomlReader& toml, std::string_view section, std::string_view key,
                  const char* env, bool def) {
  if (toml.has(section, key)) return toml.get_bool(section, key, def);
  const char* v = getenv_compat(env);
  if (!v) return def;
  if (v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N') return false;
  return true;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::unexpected<ConfigError> bad(ConfigError::Kind k, std::string detail) {
  return std::unexpected(ConfigError{k, std::move(detail)});
}

} // namespace

std::string default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/mapwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/mapwatch/config.toml";
  return "config.toml";
}

std::expected<MonitorConfig, ConfigError> config_from_toml(const util::TomlReader& toml) {
  MonitorConfig cfg;

  // [prtg]
  cfg.prtg.base_url = resolve_string(toml, "prtg", "base_url", "MAPWATCH_PRTG_URL", "");
  while (cfg.prtg.base_url.ends_with('/')) cfg.prtg.base_url.pop_back();
  if (cfg.prtg.base_url.empty()) return bad(ConfigError::Kind::MissingBaseUrl, "[prtg] base_url");
  cfg.prtg.username = resolve_string(toml, "prtg", "username", "MAPWATCH_PRTG_USERNAME", "");
  cfg.prtg.password = resolve_string(toml, "prtg", "password", "MAPWATCH_PRTG_PASSWORD", "");
  cfg.prtg.verify_tls = resolve_bool(toml, "prtg", "verify_tls", "MAPWATCH_PRTG_VERIFY_TLS", true);
  auto prtg_timeout = resolve_int(toml, "prtg", "timeout_s", "MAPWATCH_PRTG_TIMEOUT", cfg.prtg.timeout_s);
  if (!prtg_timeout || *prtg_timeout <= 0) return bad(ConfigError::Kind::BadValue, "[prtg] timeout_s");
  cfg.prtg.timeout_s = *prtg_timeout;

  // [monitoring]
  auto interval = resolve_int(toml, "monitoring", "interval_seconds", "MAPWATCH_INTERVAL", 60);
  if (!interval || *interval <= 0)
    return bad(ConfigError::Kind::BadInterval, "[monitoring] interval_seconds must be a positive integer");
  cfg.monitor.interval = std::chrono::seconds(*interval);

  // [classifier]
  std::string mode = lower(resolve_string(toml, "classifier", "mode", "MAPWATCH_CLASSIFIER_MODE", "class"));
  if (mode == "class") cfg.rules.mode = IndicatorMode::Class;
  else if (mode == "color" || mode == "colour") cfg.rules.mode = IndicatorMode::Color;
  else return bad(ConfigError::Kind::BadValue, "[classifier] mode must be \"class\" or \"color\", got \"" + mode + "\"");
  cfg.rules.error_class = toml.get_string("classifier", "error_class", cfg.rules.error_class);
  cfg.rules.warning_class = toml.get_string("classifier", "warning_class", cfg.rules.warning_class);
  cfg.rules.ok_class = toml.get_string("classifier", "ok_class", cfg.rules.ok_class);
  cfg.rules.swatch_class = toml.get_string("classifier", "swatch_class", cfg.rules.swatch_class);
  cfg.rules.error_color = toml.get_string("classifier", "error_color", cfg.rules.error_color);
  cfg.rules.warning_color = toml.get_string("classifier", "warning_color", cfg.rules.warning_color);
  cfg.rules.normal_color = toml.get_string("classifier", "normal_color", cfg.rules.normal_color);
  for (const std::string* c : {&cfg.rules.error_color, &cfg.rules.warning_color, &cfg.rules.normal_color}) {
    if (!util::normalize_color(*c)) return bad(ConfigError::Kind::BadValue, "[classifier] unparseable color \"" + *c + "\"");
  }

  // [smtp] + [email]
  cfg.mail.server = resolve_string(toml, "smtp", "server", "MAPWATCH_SMTP_SERVER", "");
  auto port = resolve_int(toml, "smtp", "port", "MAPWATCH_SMTP_PORT", cfg.mail.port);
  if (!port || *port <= 0 || *port > 65535) return bad(ConfigError::Kind::BadValue, "[smtp] port");
  cfg.mail.port = static_cast<int>(*port);
  cfg.mail.use_tls = resolve_bool(toml, "smtp", "use_tls", "MAPWATCH_SMTP_TLS", true);
  cfg.mail.verify_tls = resolve_bool(toml, "smtp", "verify_tls", "MAPWATCH_SMTP_VERIFY_TLS", true);
  cfg.mail.username = resolve_string(toml, "smtp", "username", "MAPWATCH_SMTP_USERNAME", "");
  cfg.mail.password = resolve_string(toml, "smtp", "password", "MAPWATCH_SMTP_PASSWORD", "");
  auto smtp_timeout = resolve_int(toml, "smtp", "timeout_s", "MAPWATCH_SMTP_TIMEOUT", cfg.mail.timeout_s);
  if (!smtp_timeout || *smtp_timeout <= 0) return bad(ConfigError::Kind::BadValue, "[smtp] timeout_s");
  cfg.mail.timeout_s = *smtp_timeout;
  cfg.mail.sender = resolve_string(toml, "email", "sender", "MAPWATCH_EMAIL_SENDER", cfg.mail.username);
  cfg.mail.recipients = toml.get_string_list("email", "recipients");
  if (cfg.mail.recipients.empty()) {
    if (const char* v = getenv_compat("MAPWATCH_EMAIL_RECIPIENTS")) {
      std::string_view sv(v);
      while (!sv.empty()) {
        auto comma = sv.find(',');
        std::string_view item = sv.substr(0, comma);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
        if (!item.empty()) cfg.mail.recipients.emplace_back(item);
        sv.remove_prefix(comma == std::string_view::npos ? sv.size() : comma + 1);
      }
    }
  }

  // [log], [metrics]
  cfg.log_dir = resolve_string(toml, "log", "dir", "MAPWATCH_LOG_DIR", "");
  auto mport = resolve_int(toml, "metrics", "port", "MAPWATCH_METRICS_PORT", 0);
  if (!mport || *mport < 0 || *mport > 65535) return bad(ConfigError::Kind::BadValue, "[metrics] port");
  cfg.metrics_port = static_cast<uint16_t>(*mport);
  cfg.metrics_bind = resolve_string(toml, "metrics", "bind", "MAPWATCH_METRICS_BIND", cfg.metrics_bind);

  // [[entity]]
  std::unordered_set<std::string> seen;
  for (const auto& t : toml.tables("entity")) {
    model::Entity e;
    e.id = t.get_string("id");
    e.dashboard_ref = t.has("ref") ? t.get_string("ref") : t.get_string("map_id");
    if (e.id.empty()) e.id = e.dashboard_ref;
    if (e.dashboard_ref.empty()) e.dashboard_ref = e.id;
    if (e.id.empty())
      return bad(ConfigError::Kind::BadValue, "[[entity]] #" + std::to_string(cfg.entities.size() + 1) + " has neither id nor ref");
    e.display_name = t.get_string("name", e.id);
    if (e.display_name.empty()) e.display_name = e.id;
    if (!seen.insert(e.id).second)
      return bad(ConfigError::Kind::BadValue, "duplicate entity id \"" + e.id + "\"");
    cfg.entities.push_back(std::move(e));
  }
  if (cfg.entities.empty()) return bad(ConfigError::Kind::NoEntities, "add at least one [[entity]] table");

  return cfg;
}

std::expected<MonitorConfig, ConfigError> load_config(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    return bad(ConfigError::Kind::Unreadable, path + ": not found");
  util::TomlReader toml;
  if (!toml.load(path)) return bad(ConfigError::Kind::Unreadable, path + ": cannot open");
  return config_from_toml(toml);
}

} // namespace mapwatch::app
