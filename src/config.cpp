#include <lrp/config.hpp>
#include <yaml-cpp/yaml.h>

namespace lrp {

template <class T>
static void read_opt(const YAML::Node& parent, const char* key, T& out) {
  const YAML::Node n = parent[key];
  if (!n || n.IsNull()) return;
  out = n.as<T>();
}

static Config from_node(const YAML::Node& root) {
  Config cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) throw ConfigError("config root must be a mapping");

  if (const YAML::Node pb = root["playback"]) {
    read_opt(pb, "period_ms", cfg.playback.period_ms);
    read_opt(pb, "max_timestamp_s", cfg.playback.max_timestamp_s);
  }
  if (const YAML::Node sk = root["sink"]) {
    read_opt(sk, "host", cfg.sink.host);
    read_opt(sk, "port", cfg.sink.port);
    read_opt(sk, "table", cfg.sink.table);
    read_opt(sk, "connect", cfg.sink.connect);
  }
  if (const YAML::Node lg = root["logging"]) {
    read_opt(lg, "level", cfg.logging.level);
    read_opt(lg, "pattern", cfg.logging.pattern);
  }

  if (cfg.playback.period_ms <= 0) throw ConfigError("playback.period_ms must be positive");
  if (!(cfg.playback.max_timestamp_s > 0.0) || !(cfg.playback.max_timestamp_s <= kMaxTimestampLimitS)) {
    throw ConfigError("playback.max_timestamp_s must be in (0, 1e6]");
  }
  if (cfg.sink.port < 1 || cfg.sink.port > 65535) throw ConfigError("sink.port must be in 1..65535");
  if (cfg.sink.host.empty()) throw ConfigError("sink.host must not be empty");
  return cfg;
}

Config config_from_yaml(const std::string& text) {
  try {
    return from_node(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
}

Config load_config(const std::string& path) {
  try {
    return from_node(YAML::LoadFile(path));
  } catch (const YAML::BadFile&) {
    throw ConfigError("cannot read config file: " + path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("invalid config " + path + ": " + e.what());
  }
}

} // namespace lrp
