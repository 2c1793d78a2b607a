#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace heroes::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using opentelemetry::nostd::string_view;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpExport& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

string_view View(std::string_view value) {
  return string_view(value.data(), value.size());
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> instruction_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      instruction_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> external_call_count;
};

bool InitializeMetrics(const heroes::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(ResolveOtlpExport(config, OtlpSignal::kMetrics)), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", std::string("hero-registry")}}));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("hero-registry", "0.1.0");

  impl_->instruction_count      = meter->CreateUInt64Counter("heroes.instruction.count", "Processed ledger instructions", "1");
  impl_->instruction_latency_ms = meter->CreateDoubleHistogram("heroes.instruction.latency_ms", "Instruction latency in milliseconds", "ms");
  impl_->external_call_count    = meter->CreateUInt64Counter("heroes.external_call.count", "Calls into token, payment and metadata services", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordInstruction(std::string_view op, bool success) {
  impl_->instruction_count->Add(1, {{"op", View(op)}, {"success", success}}, opentelemetry::context::Context{});
}

void Metrics::ObserveInstructionLatencyMs(std::string_view op, double latency_ms) {
  impl_->instruction_latency_ms->Record(latency_ms, {{"op", View(op)}}, opentelemetry::context::Context{});
}

void Metrics::RecordExternalCall(std::string_view call, bool success) {
  impl_->external_call_count->Add(1, {{"call", View(call)}, {"success", success}}, opentelemetry::context::Context{});
}

} // namespace heroes::observability

#endif
