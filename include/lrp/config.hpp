#pragma once
#include <stdexcept>
#include <string>

namespace lrp {

// Largest accepted sample cutoff; keeps seek offsets inside the clock's range.
inline constexpr double kMaxTimestampLimitS = 1e6;

struct PlaybackConfig {
  int period_ms = 20;
  double max_timestamp_s = 1000.0;

  double period_s() const { return period_ms / 1000.0; }
};

struct SinkConfig {
  std::string host = "127.0.0.1";
  int port = 5810;
  std::string table = "Replay"; // key prefix at the sink
  bool connect = false;         // connect at startup instead of on SET_SERVER
};

struct LoggingConfig {
  std::string level = "info";
  std::string pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] %v";
};

struct Config {
  PlaybackConfig playback;
  SinkConfig sink;
  LoggingConfig logging;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// All keys optional; missing ones keep their defaults.
// Throws ConfigError on malformed YAML, wrong types or out-of-range values.
Config config_from_yaml(const std::string& text);
Config load_config(const std::string& path);

} // namespace lrp
