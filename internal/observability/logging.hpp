#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace collector::runtime::config {
class LoggingConfig;
}

namespace collector::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const collector::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace collector::observability

#define COLLECTOR_LOG_DEBUG(message, ...) ::collector::observability::LogDebug((message), ##__VA_ARGS__)
#define COLLECTOR_LOG_INFO(message, ...) ::collector::observability::LogInfo((message), ##__VA_ARGS__)
#define COLLECTOR_LOG_WARN(message, ...) ::collector::observability::LogWarn((message), ##__VA_ARGS__)
#define COLLECTOR_LOG_ERROR(message, ...) ::collector::observability::LogError((message), ##__VA_ARGS__)
