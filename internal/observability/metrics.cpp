#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

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
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define AUTOPILOT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define AUTOPILOT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace autopilot::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool worker_metrics_enabled{true};
};

MetricsOptions g_metrics_options;

using autopilot::runtime::config::ObservabilityConfig;

bool UsesHttp(const ObservabilityConfig& observability) {
  return observability.transport() == autopilot::runtime::config::OTLP_TRANSPORT_HTTP;
}

// config, then OTEL_EXPORTER_OTLP_METRICS_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT
std::string MetricEndpoint(const ObservabilityConfig& observability) {
  if (!observability.otlp_endpoint().empty()) {
    return observability.otlp_endpoint();
  }
  for (const char* variable : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(variable)) {
      return value;
    }
  }
  return UsesHttp(observability) ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ObservabilityConfig& observability) {
  if (UsesHttp(observability)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricEndpoint(observability);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricEndpoint(observability);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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

bool InstallProvider(const ObservabilityConfig& observability, std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  if (timeout.count() > 0) {
    reader_options.export_timeout_millis = timeout;
  }

#ifdef AUTOPILOT_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(observability), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(observability), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", "autopilot-server"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      tick_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> action_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const autopilot::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  const auto  interval_ms   = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;

  g_metrics_options.request_metrics_enabled = metric_config.request_metrics_enabled();
  g_metrics_options.worker_metrics_enabled  = metric_config.worker_metrics_enabled();

  return InstallProvider(observability, std::chrono::milliseconds(interval_ms), std::chrono::milliseconds(metric_config.export_timeout_ms()));
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
  impl_->meter  = provider->GetMeter("autopilot", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("autopilot.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("autopilot.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->tick_duration_ms   = impl_->meter->CreateDoubleHistogram("autopilot.worker.tick_duration_ms", "ms", "Autonomous worker tick duration");
  impl_->action_outcomes    = impl_->meter->CreateUInt64Counter("autopilot.actions.count", "1", "Candidate actions by pipeline stage");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("autopilot.queue.depth", "Actions per queue status", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [status, depth] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"status", status}};
          int_result->Observe(depth, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveTickDurationMs(double duration_ms) {
  if (!impl_ || !impl_->tick_duration_ms || !g_metrics_options.worker_metrics_enabled) {
    return;
  }

  RecordWithAttributes(impl_->tick_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordActionOutcome(std::string_view stage, std::string_view action_type, std::uint64_t count) {
  if (!impl_ || !impl_->action_outcomes || !g_metrics_options.worker_metrics_enabled || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"stage", std::string(stage)}, {"action_type", std::string(action_type)}};
  AddWithAttributes(impl_->action_outcomes, count, attributes);
}

void Metrics::SetQueueDepth(std::string_view status, std::uint64_t depth) {
  if (!impl_ || !impl_->queue_depth_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(status)] = static_cast<std::int64_t>(depth);
}

} // namespace autopilot::observability

#endif
