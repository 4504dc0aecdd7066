#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace eventstore::runtime::config {
class RuntimeConfig;
}

namespace eventstore::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

/*
  Creates the process logger from config (env overrides config) and
  registers it as spdlog's default. The returned handle is what gets passed
  into the store core; nothing in the core reaches for the default logger.
*/
std::shared_ptr<spdlog::logger> InitializeLogging(const eventstore::runtime::config::RuntimeConfig& config);
void                            ShutdownLogging();

// Logger that discards everything (tests, embedding without output).
std::shared_ptr<spdlog::logger> NullLogger();

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void LogDebug(spdlog::logger& logger, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(logger, spdlog::level::debug, message, fields);
}

inline void LogInfo(spdlog::logger& logger, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(logger, spdlog::level::info, message, fields);
}

inline void LogWarn(spdlog::logger& logger, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(logger, spdlog::level::warn, message, fields);
}

inline void LogError(spdlog::logger& logger, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(logger, spdlog::level::err, message, fields);
}

} // namespace eventstore::observability

#define EVENTSTORE_LOG_DEBUG(logger, message, ...) ::eventstore::observability::LogDebug((logger), (message), ##__VA_ARGS__)
#define EVENTSTORE_LOG_INFO(logger, message, ...) ::eventstore::observability::LogInfo((logger), (message), ##__VA_ARGS__)
#define EVENTSTORE_LOG_WARN(logger, message, ...) ::eventstore::observability::LogWarn((logger), (message), ##__VA_ARGS__)
#define EVENTSTORE_LOG_ERROR(logger, message, ...) ::eventstore::observability::LogError((logger), (message), ##__VA_ARGS__)
