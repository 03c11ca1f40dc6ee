#include <lrp/logging.hpp>
#include <cstdio>
#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lrp::log {

namespace {

constexpr const char* kLoggerName = "logreplay";

std::string resolve_level(const LoggingConfig& cfg) {
  if (const char* level = std::getenv("LRP_LOG_LEVEL")) return level;
  return cfg.level.empty() ? "info" : cfg.level;
}

std::string resolve_pattern(const LoggingConfig& cfg) {
  if (const char* pattern = std::getenv("LRP_LOG_PATTERN")) return pattern;
  return cfg.pattern.empty() ? LoggingConfig{}.pattern : cfg.pattern;
}

std::string serialize(std::initializer_list<Field> fields) {
  std::string out;
  for (const auto& f : fields) {
    if (!out.empty()) out.push_back(' ');
    out += f.key;
    out.push_back('=');
    out += f.value;
  }
  return out;
}

} // namespace

Field real(std::string_view key, double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6g", value);
  return {std::string(key), buf};
}

void init(const LoggingConfig& cfg) {
  // stdout carries the control protocol; logs go to stderr.
  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(resolve_pattern(cfg));
  logger->set_level(spdlog::level::from_str(resolve_level(cfg)));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void shutdown() {
  spdlog::shutdown();
}

void write(spdlog::level::level_enum level, std::string_view message, std::initializer_list<Field> fields) {
  if (!spdlog::should_log(level)) return;
  const std::string rendered = serialize(fields);
  if (rendered.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, rendered);
  }
}

} // namespace lrp::log
