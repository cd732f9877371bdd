#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace sportsledger::observability {
namespace {

std::string ResolveLevel(const sportsledger::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SPORTSLEDGER_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const sportsledger::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SPORTSLEDGER_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const sportsledger::runtime::config::RuntimeConfig& config) {
  const auto level_name = ResolveLevel(config);
  const auto level      = spdlog::level::from_str(level_name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && level_name != "off") {
    throw std::runtime_error("Invalid configuration: unknown log level " + level_name);
  }

  // stderr keeps command output on stdout machine-readable
  auto logger = spdlog::get("sportsledger");
  if (!logger) {
    logger = spdlog::stderr_color_mt("sportsledger");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace sportsledger::observability
