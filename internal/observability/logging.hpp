#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stpa::runtime::config {
class RuntimeConfig;
}

namespace stpa::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

// Command line tools log to stderr so that stdout carries only their output.
enum class LogTarget {
  kStdout,
  kStderr,
};

void InitializeLogging(const stpa::runtime::config::RuntimeConfig& config, LogTarget target = LogTarget::kStdout);
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

} // namespace stpa::observability

#define STPA_LOG_DEBUG(message, ...) ::stpa::observability::LogDebug((message), ##__VA_ARGS__)
#define STPA_LOG_INFO(message, ...) ::stpa::observability::LogInfo((message), ##__VA_ARGS__)
#define STPA_LOG_WARN(message, ...) ::stpa::observability::LogWarn((message), ##__VA_ARGS__)
#define STPA_LOG_ERROR(message, ...) ::stpa::observability::LogError((message), ##__VA_ARGS__)
