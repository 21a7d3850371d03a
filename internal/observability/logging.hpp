#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace portwatch::runtime::config {
class RuntimeConfig;
}

namespace portwatch::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Values containing spaces or '=' are quoted so lines stay key=value parseable.
std::string SerializeFields(std::initializer_list<LogField> fields);

void InitializeLogging(const portwatch::runtime::config::RuntimeConfig& config);
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

} // namespace portwatch::observability

#define PORTWATCH_LOG_DEBUG(message, ...) ::portwatch::observability::LogDebug((message), ##__VA_ARGS__)
#define PORTWATCH_LOG_INFO(message, ...) ::portwatch::observability::LogInfo((message), ##__VA_ARGS__)
#define PORTWATCH_LOG_WARN(message, ...) ::portwatch::observability::LogWarn((message), ##__VA_ARGS__)
#define PORTWATCH_LOG_ERROR(message, ...) ::portwatch::observability::LogError((message), ##__VA_ARGS__)
