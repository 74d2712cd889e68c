#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace piecework::runtime::config {
class RuntimeConfig;
}

namespace piecework::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern: PIECEWORK_LOG_LEVEL / PIECEWORK_LOG_PATTERN, then config, then defaults.
// Output goes to stderr so command output on stdout stays machine-readable.
void InitializeLogging(const piecework::runtime::config::RuntimeConfig& config);
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

} // namespace piecework::observability

#define PIECEWORK_LOG_DEBUG(message, ...) ::piecework::observability::LogDebug((message), ##__VA_ARGS__)
#define PIECEWORK_LOG_INFO(message, ...) ::piecework::observability::LogInfo((message), ##__VA_ARGS__)
#define PIECEWORK_LOG_WARN(message, ...) ::piecework::observability::LogWarn((message), ##__VA_ARGS__)
#define PIECEWORK_LOG_ERROR(message, ...) ::piecework::observability::LogError((message), ##__VA_ARGS__)
