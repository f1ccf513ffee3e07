#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace coordinator::runtime::config {
class RuntimeConfig;
}

namespace coordinator::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  LogContext

  Fields attached to every line logged on the current thread while the
  context is alive. Contexts nest; inner fields follow outer ones.
  Used to stamp workflow and workload ids on everything a poll or a
  scaling tick logs.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

  // Fields currently in effect on this thread, outermost first.
  static const std::vector<LogField>& Current();

 private:
  std::size_t restore_size_;
};

void InitializeLogging(const coordinator::runtime::config::RuntimeConfig& config);
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

} // namespace coordinator::observability

#define COORDINATOR_LOG_DEBUG(message, ...) ::coordinator::observability::LogDebug((message), ##__VA_ARGS__)
#define COORDINATOR_LOG_INFO(message, ...) ::coordinator::observability::LogInfo((message), ##__VA_ARGS__)
#define COORDINATOR_LOG_WARN(message, ...) ::coordinator::observability::LogWarn((message), ##__VA_ARGS__)
#define COORDINATOR_LOG_ERROR(message, ...) ::coordinator::observability::LogError((message), ##__VA_ARGS__)
