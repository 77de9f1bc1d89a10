#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include "app/Classifier.hpp"
#include "app/MailSink.hpp"
#include "app/Monitor.hpp"
#include "collectors/PrtgGateway.hpp"
#include "model/Entity.hpp"
#include "util/TomlReader.hpp"

namespace mapwatch::app {

struct MonitorConfig {
  collectors::PrtgOptions prtg;
  MailOptions mail;
  ClassifierRules rules;
  MonitorOptions monitor;
  std::vector<model::Entity> entities;
  std::string log_dir;          // empty: no check history
  uint16_t metrics_port{0};     // 0: metrics server off
  std::string metrics_bind{"0.0.0.0"};
};

struct ConfigError {
  enum class Kind { Unreadable, NoEntities, MissingBaseUrl, BadInterval, BadValue };
  Kind kind;
  std::string detail;
};

[[nodiscard]] const char* describe(ConfigError::Kind k);

// $XDG_CONFIG_HOME/mapwatch/config.toml, else ~/.config/mapwatch/config.toml
[[nodiscard]] std::string default_config_path();

// Each value resolves TOML -> MAPWATCH_* environment -> compiled default.
[[nodiscard]] std::expected<MonitorConfig, ConfigError> load_config(const std::string& path);
[[nodiscard]] std::expected<MonitorConfig, ConfigError> config_from_toml(const util::TomlReader& toml);

} // namespace mapwatch::app
