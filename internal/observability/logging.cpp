#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace portwatch::observability {
namespace {

constexpr const char* kLoggerName = "portwatch";

std::string ResolveLevel(const portwatch::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("PORTWATCH_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const portwatch::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("PORTWATCH_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" =\"\t\n") != std::string_view::npos;
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

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (NeedsQuoting(field.value)) {
      out << '"';
      for (char c : field.value) {
        if (c == '"' || c == '\\') out << '\\';
        out << (c == '\n' ? ' ' : c);
      }
      out << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

void InitializeLogging(const portwatch::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, SerializeFields(fields));
}

} // namespace portwatch::observability
