#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace x402::runtime::config {
class RuntimeConfig;
}

namespace x402::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Level and pattern come from X402_LOG_LEVEL / X402_LOG_PATTERN, then the
// config, then defaults ("info"). Logs go to stderr through the "x402"
// logger. Throws std::runtime_error for an unknown level name.
void InitializeLogging(const x402::runtime::config::RuntimeConfig& config);
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

} // namespace x402::observability

#define X402_LOG_DEBUG(message, ...) ::x402::observability::LogDebug((message), ##__VA_ARGS__)
#define X402_LOG_INFO(message, ...) ::x402::observability::LogInfo((message), ##__VA_ARGS__)
#define X402_LOG_WARN(message, ...) ::x402::observability::LogWarn((message), ##__VA_ARGS__)
#define X402_LOG_ERROR(message, ...) ::x402::observability::LogError((message), ##__VA_ARGS__)
