#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace waypoint::runtime::config {
class RuntimeConfig;
}

namespace waypoint::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from WAYPOINT_LOG_LEVEL / WAYPOINT_LOG_PATTERN, then the config.
void InitializeLogging(const waypoint::runtime::config::RuntimeConfig& config);
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

} // namespace waypoint::observability

#define WAYPOINT_LOG_DEBUG(message, ...) ::waypoint::observability::LogDebug((message), ##__VA_ARGS__)
#define WAYPOINT_LOG_INFO(message, ...) ::waypoint::observability::LogInfo((message), ##__VA_ARGS__)
#define WAYPOINT_LOG_WARN(message, ...) ::waypoint::observability::LogWarn((message), ##__VA_ARGS__)
#define WAYPOINT_LOG_ERROR(message, ...) ::waypoint::observability::LogError((message), ##__VA_ARGS__)
