#pragma once

#include <memory>
#include <string_view>

namespace heroes::runtime::config {
class RuntimeConfig;
}

namespace heroes::observability {

bool InitializeTracing(const heroes::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const heroes::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  One span per instruction or RPC. Ends when the scope does.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Ledger metrics:
    heroes.instruction.count{op,success}
    heroes.instruction.latency_ms{op}
    heroes.external_call.count{call,success}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordInstruction(std::string_view op, bool success);
  void ObserveInstructionLatencyMs(std::string_view op, double latency_ms);
  void RecordExternalCall(std::string_view call, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const heroes::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const heroes::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordInstruction(std::string_view, bool) {
}

inline void Metrics::ObserveInstructionLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordExternalCall(std::string_view, bool) {
}
#endif

} // namespace heroes::observability
