#pragma once

#include <string>

namespace heroes::runtime::config {
class RuntimeConfig;
}

namespace heroes::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpExport {
  std::string endpoint;
  bool        http = false;
};

/*
  Exporter target for one signal.

  Endpoint order:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    collector default for the transport (4317 grpc, 4318 http with the signal path)
*/
OtlpExport ResolveOtlpExport(const heroes::runtime::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace heroes::observability
