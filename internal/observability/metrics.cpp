#include "internal/observability/spans.hpp"

#ifdef ROSTER_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ROSTER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ROSTER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace roster::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool ledger_metrics_enabled{true};
  bool route_labels_enabled{true};
};

MetricsOptions g_metrics_options;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

void InstallProvider(const OtlpConfig& config, std::unique_ptr<sdkmetrics::PushMetricExporter> exporter,
                     const sdkmetrics::PeriodicExportingMetricReaderOptions& reader_options) {
#ifdef ROSTER_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> move_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> claim_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      claim_batch_duration_ms;
};

bool InitializeMetrics(const roster::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == roster::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  InstallProvider(otlp_config, BuildExporter(otlp_config), reader_options);

  g_metrics_options.request_metrics_enabled = metric_config.request_metrics_enabled();
  g_metrics_options.ledger_metrics_enabled  = metric_config.ledger_metrics_enabled();
  g_metrics_options.route_labels_enabled    = metric_config.route_labels_enabled();

  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("roster-ledger", "0.1.0");

  impl_->request_count           = impl_->meter->CreateUInt64Counter("roster.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms      = impl_->meter->CreateDoubleHistogram("roster.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->move_outcomes           = impl_->meter->CreateUInt64Counter("roster.move.outcomes", "1", "Roster moves by result status");
  impl_->claim_outcomes          = impl_->meter->CreateUInt64Counter("roster.claim.outcomes", "1", "Processed claims by final status");
  impl_->claim_batch_duration_ms = impl_->meter->CreateDoubleHistogram("roster.claim.batch_duration_ms", "ms", "Claim batch processing duration in milliseconds");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordMoveOutcome(std::string_view status) {
  if (!impl_ || !impl_->move_outcomes || !g_metrics_options.ledger_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->move_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordClaimOutcome(std::string_view status) {
  if (!impl_ || !impl_->claim_outcomes || !g_metrics_options.ledger_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->claim_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveClaimBatchDurationMs(double duration_ms) {
  if (!impl_ || !impl_->claim_batch_duration_ms || !g_metrics_options.ledger_metrics_enabled) {
    return;
  }

  RecordWithAttributes(impl_->claim_batch_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

} // namespace roster::observability

#endif
