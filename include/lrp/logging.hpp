#pragma once
#include <concepts>
#include <initializer_list>
#include <string>
#include <string_view>
#include <spdlog/common.h>
#include <lrp/config.hpp>

namespace lrp::log {

struct Field {
  std::string key;
  std::string value;
};

inline Field str(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

template <std::integral T>
Field num(std::string_view key, T value) {
  return {std::string(key), std::to_string(value)};
}

Field real(std::string_view key, double value);

// Installs the "logreplay" logger on stderr as the default logger.
// LRP_LOG_LEVEL / LRP_LOG_PATTERN override the config.
void init(const LoggingConfig& cfg);
void shutdown();

// "message key=value key=value"
void write(spdlog::level::level_enum level, std::string_view message,
           std::initializer_list<Field> fields = {});

inline void debug(std::string_view m, std::initializer_list<Field> f = {}) { write(spdlog::level::debug, m, f); }
inline void info(std::string_view m, std::initializer_list<Field> f = {})  { write(spdlog::level::info, m, f); }
inline void warn(std::string_view m, std::initializer_list<Field> f = {})  { write(spdlog::level::warn, m, f); }
inline void error(std::string_view m, std::initializer_list<Field> f = {}) { write(spdlog::level::err, m, f); }

} // namespace lrp::log
