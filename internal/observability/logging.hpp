#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace heroes::model {
class Pubkey;
}

namespace heroes::runtime::config {
class RuntimeConfig;
}

namespace heroes::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField KeyField(std::string_view key, const model::Pubkey& value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const heroes::runtime::config::RuntimeConfig& config);
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

} // namespace heroes::observability

#define HEROES_LOG_DEBUG(message, ...) ::heroes::observability::LogDebug((message), ##__VA_ARGS__)
#define HEROES_LOG_INFO(message, ...) ::heroes::observability::LogInfo((message), ##__VA_ARGS__)
#define HEROES_LOG_WARN(message, ...) ::heroes::observability::LogWarn((message), ##__VA_ARGS__)
#define HEROES_LOG_ERROR(message, ...) ::heroes::observability::LogError((message), ##__VA_ARGS__)
