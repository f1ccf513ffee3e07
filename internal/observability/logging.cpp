#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace coordinator::observability {
namespace {

// Unknown names fall back to info; spdlog would otherwise map them to off.
spdlog::level::level_enum ResolveLevel(const coordinator::runtime::config::RuntimeConfig& config, std::string& rejected) {
  std::string name = "info";
  if (const char* level = std::getenv("COORDINATOR_LOG_LEVEL")) {
    name = level;
  } else if (!config.logging().level().empty()) {
    name = config.logging().level();
  }

  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    rejected = name;
    return spdlog::level::info;
  }
  return level;
}

std::string ResolvePattern(const coordinator::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("COORDINATOR_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const coordinator::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("COORDINATOR_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" =\"\t\n") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out += ' ';
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (const char c : field.value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

// context fields first, then the call's own fields
std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : t_context) AppendField(out, field);
  for (const auto& field : fields) AppendField(out, field);
  return out;
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogContext::LogContext(std::initializer_list<LogField> fields) : restore_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(restore_size_);
}

const std::vector<LogField>& LogContext::Current() {
  return t_context;
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.4g}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const coordinator::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("workflow-coordinator");
  if (!logger) {
    logger = spdlog::stdout_color_mt("workflow-coordinator");
  }
  std::string rejected_level;
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config, rejected_level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (!rejected_level.empty()) {
    LogWarn("unknown log level, using info", {StringField("level", rejected_level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
    return;
  }
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace coordinator::observability
