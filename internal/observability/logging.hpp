#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace pmm::runtime::config {
class RuntimeConfig;
}

namespace pmm::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level names accepted in config and PMM_LOG_LEVEL; nullopt for unknown names.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

// key=value pairs separated by spaces; values with spaces, '=' or quotes are quoted.
std::string FormatLogFields(std::initializer_list<LogField> fields);

void InitializeLogging(const pmm::runtime::config::RuntimeConfig& config);
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

} // namespace pmm::observability

#define PMM_LOG_DEBUG(message, ...) ::pmm::observability::LogDebug((message), ##__VA_ARGS__)
#define PMM_LOG_INFO(message, ...) ::pmm::observability::LogInfo((message), ##__VA_ARGS__)
#define PMM_LOG_WARN(message, ...) ::pmm::observability::LogWarn((message), ##__VA_ARGS__)
#define PMM_LOG_ERROR(message, ...) ::pmm::observability::LogError((message), ##__VA_ARGS__)
