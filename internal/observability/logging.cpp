#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace pmm::observability {
namespace {

constexpr const char*               kLoggerName     = "pmm";
constexpr spdlog::level::level_enum kDefaultLevel   = spdlog::level::warn;
constexpr const char*               kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevelName(const pmm::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("PMM_LOG_LEVEL")) {
    return level;
  }
  return config.logging().level();
}

std::string ResolvePattern(const pmm::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("PMM_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return kDefaultPattern;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '=' || c == '"') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
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

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  // spdlog::level::from_str maps unknown names to "off", which would silence a typo.
  if (name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;

  static constexpr std::array<spdlog::level::level_enum, 7> kLevels = {
      spdlog::level::trace, spdlog::level::debug,    spdlog::level::info, spdlog::level::warn,
      spdlog::level::err,   spdlog::level::critical, spdlog::level::off,
  };
  for (auto level : kLevels) {
    const auto level_name = spdlog::level::to_string_view(level);
    if (name == std::string_view(level_name.data(), level_name.size())) return level;
  }
  return std::nullopt;
}

std::string FormatLogFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out += field.key;
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const pmm::runtime::config::RuntimeConfig& config) {
  const auto level_name = ResolveLevelName(config);
  const auto level      = level_name.empty() ? std::optional(kDefaultLevel) : ParseLogLevel(level_name);

  // stdout carries command output (sidecar JSON), so logs go to stderr.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level.value_or(kDefaultLevel));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!level) {
    LogWarn("Unknown log level, using warn", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = FormatLogFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace pmm::observability
