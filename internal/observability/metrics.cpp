#include "internal/observability/spans.hpp"

#ifdef TICKETFLOW_ENABLE_OTEL

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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace ticketflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct ReaderOptions {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds timeout{0};
};

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

bool Install(const OtlpConfig& config, const ReaderOptions& reader_config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = reader_config.interval;
  if (reader_config.timeout.count() > 0) {
    // the SDK rejects a timeout longer than the interval
    reader_options.export_timeout_millis = std::min(reader_config.timeout, reader_config.interval);
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto res   = BuildResource(config);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> pages;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> files;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> file_retries;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      file_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rollbacks;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> runs;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      run_duration_ms;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return Install(config, ReaderOptions{});
}

bool InitializeMetrics(const ticketflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  if (!observability.service_name().empty()) otlp_config.service_name = observability.service_name();
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == ticketflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  ReaderOptions reader;
  if (observability.metrics_interval_ms() > 0) reader.interval = std::chrono::milliseconds(observability.metrics_interval_ms());
  reader.timeout = std::chrono::milliseconds(observability.metrics_export_timeout_ms());
  return Install(otlp_config, reader);
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
  impl_->meter  = provider->GetMeter("ticketflow", "0.1.0");

  impl_->pages            = impl_->meter->CreateUInt64Counter("ticketflow.pages", "Pages processed, by outcome", "1");
  impl_->files            = impl_->meter->CreateUInt64Counter("ticketflow.files", "Files finished, by status", "1");
  impl_->file_retries     = impl_->meter->CreateUInt64Counter("ticketflow.file.retries", "Attempts beyond the first", "1");
  impl_->file_duration_ms = impl_->meter->CreateDoubleHistogram("ticketflow.file.duration_ms", "Wall time per file", "ms");
  impl_->rollbacks        = impl_->meter->CreateUInt64Counter("ticketflow.file.rollbacks", "Per-file rollbacks of partial results", "1");
  impl_->runs             = impl_->meter->CreateUInt64Counter("ticketflow.runs", "Sealed processing runs, by status", "1");
  impl_->run_duration_ms  = impl_->meter->CreateDoubleHistogram("ticketflow.run.duration_ms", "Wall time per run", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPage(std::string_view outcome) {
  if (!impl_ || !impl_->pages) {
    return;
  }

  const std::string                          label(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", opentelemetry::nostd::string_view(label)}};
  AddWithAttributes(impl_->pages, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordFile(std::string_view status, int attempts) {
  if (!impl_ || !impl_->files) {
    return;
  }

  const std::string                          label(status);
  const std::initializer_list<AttributePair> attributes = {{"status", opentelemetry::nostd::string_view(label)}};
  AddWithAttributes(impl_->files, static_cast<std::uint64_t>(1), attributes);
  if (attempts > 1) {
    AddWithAttributes(impl_->file_retries, static_cast<std::uint64_t>(attempts - 1), std::initializer_list<AttributePair>{});
  }
}

void Metrics::ObserveFileDurationMs(double duration_ms) {
  if (!impl_ || !impl_->file_duration_ms) {
    return;
  }

  RecordWithAttributes(impl_->file_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordRollback(bool success) {
  if (!impl_ || !impl_->rollbacks) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->rollbacks, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRun(std::string_view status, double duration_ms) {
  if (!impl_ || !impl_->runs) {
    return;
  }

  const std::string                          label(status);
  const std::initializer_list<AttributePair> attributes = {{"status", opentelemetry::nostd::string_view(label)}};
  AddWithAttributes(impl_->runs, static_cast<std::uint64_t>(1), attributes);
  RecordWithAttributes(impl_->run_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

} // namespace ticketflow::observability

#endif
