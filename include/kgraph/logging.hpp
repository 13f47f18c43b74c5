#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace kgraph {

struct LoggingConfig {
  // debug, info, warn, error (spdlog level names are accepted too)
  std::string level = "info";
  // spdlog pattern; empty selects the default
  std::string pattern;
};

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/**
 * Install the "kgraph" stdout logger as spdlog's default logger.
 * KGRAPH_LOG_LEVEL and KGRAPH_LOG_PATTERN override the config. Safe to call
 * more than once.
 */
void InitializeLogging(const LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

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

}  // namespace kgraph

#define KGRAPH_LOG_DEBUG(message, ...) ::kgraph::LogDebug((message), ##__VA_ARGS__)
#define KGRAPH_LOG_INFO(message, ...) ::kgraph::LogInfo((message), ##__VA_ARGS__)
#define KGRAPH_LOG_WARN(message, ...) ::kgraph::LogWarn((message), ##__VA_ARGS__)
#define KGRAPH_LOG_ERROR(message, ...) ::kgraph::LogError((message), ##__VA_ARGS__)
