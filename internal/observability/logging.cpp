#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/model/pubkey.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace heroes::observability {
namespace {

std::string ResolveLevel(const heroes::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("HEROES_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const heroes::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("HEROES_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const heroes::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("HEROES_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line += " trace_id=";
  line.append(trace_id, sizeof(trace_id));
  line += " span_id=";
  line.append(span_id, sizeof(span_id));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField KeyField(std::string_view key, const model::Pubkey& value) {
  return {std::string(key), value.ToString()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const heroes::runtime::config::RuntimeConfig& config) {
  spdlog::drop("hero-registry");
  auto logger = spdlog::stdout_color_mt("hero-registry");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

// One line per event: "<message> key=value ... [trace_id=.. span_id=..]".
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace heroes::observability
