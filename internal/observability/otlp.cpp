#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace heroes::observability {

OtlpExport ResolveOtlpExport(const heroes::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpExport out;
  out.http = observability.transport() == heroes::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    out.endpoint = observability.otlp_endpoint();
    return out;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) {
    out.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.endpoint = endpoint;
  } else if (out.http) {
    out.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    out.endpoint = "localhost:4317";
  }
  return out;
}

} // namespace heroes::observability
