#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace canary::runtime::config {
class RuntimeConfig;
}

namespace canary::observability {

/*
  Structured key=value logging on the "canary" stderr logger.

  Level and pattern come from CANARY_LOG_LEVEL / CANARY_LOG_PATTERN when
  set, else from the logging section of the config. Values containing
  spaces or quotes are quoted, so lines stay machine-splittable.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// seconds, millisecond precision
LogField SecondsField(std::string_view key, double seconds);

// Safe to call more than once; later calls only reapply level and pattern.
void InitializeLogging(const canary::runtime::config::RuntimeConfig& config);
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

} // namespace canary::observability

#define CANARY_LOG_DEBUG(message, ...) ::canary::observability::LogDebug((message), ##__VA_ARGS__)
#define CANARY_LOG_INFO(message, ...) ::canary::observability::LogInfo((message), ##__VA_ARGS__)
#define CANARY_LOG_WARN(message, ...) ::canary::observability::LogWarn((message), ##__VA_ARGS__)
#define CANARY_LOG_ERROR(message, ...) ::canary::observability::LogError((message), ##__VA_ARGS__)
