#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace devicefarm::runtime::config {
class ClientConfig;
}

namespace devicefarm::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const devicefarm::runtime::config::ClientConfig& config);
void ShutdownLogging();

/*
  Sink for the client's "[DeviceFarm] ..." progress lines.

  Returns null when logging.progress is false, which silences them.
*/
std::shared_ptr<spdlog::logger> MakeProgressLogger(const devicefarm::runtime::config::ClientConfig& config);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace devicefarm::observability

#define DEVICEFARM_LOG_INFO(message, ...) ::devicefarm::observability::LogInfo((message), ##__VA_ARGS__)
#define DEVICEFARM_LOG_WARN(message, ...) ::devicefarm::observability::LogWarn((message), ##__VA_ARGS__)
#define DEVICEFARM_LOG_ERROR(message, ...) ::devicefarm::observability::LogError((message), ##__VA_ARGS__)
