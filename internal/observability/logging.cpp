#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace eventstore::observability {
namespace {

constexpr const char* kLoggerName = "eventstore";

std::string ResolveLevel(const eventstore::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("EVENTSTORE_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const eventstore::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("EVENTSTORE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
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

std::shared_ptr<spdlog::logger> InitializeLogging(const eventstore::runtime::config::RuntimeConfig& config) {
  // re-initialisation replaces the previous logger
  spdlog::drop(kLoggerName);

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return logger;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> NullLogger() {
  auto logger = std::make_shared<spdlog::logger>("eventstore-null", std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::off);
  return logger;
}

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  if (!logger.should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    logger.log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger.log(level, "{}", message);
}

} // namespace eventstore::observability
