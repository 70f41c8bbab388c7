#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace autopilot::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

using autopilot::runtime::config::DatabaseConfig;
using autopilot::runtime::config::ObservabilityConfig;
using autopilot::runtime::config::RuntimeConfig;

constexpr const char* kServiceName   = "autopilot-server";
constexpr const char* kTracerName    = "autopilot";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& observability) {
  return observability.transport() == autopilot::runtime::config::OTLP_TRANSPORT_HTTP;
}

// config, then OTEL_EXPORTER_OTLP_TRACES_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT
std::string TraceEndpoint(const ObservabilityConfig& observability) {
  if (!observability.otlp_endpoint().empty()) {
    return observability.otlp_endpoint();
  }
  for (const char* variable : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(variable)) {
      return value;
    }
  }
  return UsesHttp(observability) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ObservabilityConfig& observability) {
  if (UsesHttp(observability)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TraceEndpoint(observability);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TraceEndpoint(observability);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// The worker emits a burst of spans once per tick; batching is the default and
// "simple" is meant for local debugging against a collector.
std::unique_ptr<sdktrace::SpanProcessor> MakeSpanProcessor(const ObservabilityConfig& observability) {
  auto exporter = MakeSpanExporter(observability);
  if (observability.tracing().processor() == ObservabilityConfig::TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
}

std::string BackendName(const DatabaseConfig& database) {
  switch (database.backend_case()) {
    case DatabaseConfig::kPostgres:
      return "postgres";
    case DatabaseConfig::kMemory:
      return "memory";
    default:
      return "sqlite";
  }
}

resource::Resource MakeResource(const RuntimeConfig& config) {
  resource::ResourceAttributes attrs = {
      {"service.name", kServiceName},
      {"service.version", kTracerVersion},
      {"autopilot.db.backend", BackendName(config.database())},
      {"autopilot.worker.mode", config.worker().has_mode() ? config.worker().mode() : std::string("suggest")},
  };
  return resource::Resource::Create(attrs);
}

} // namespace

bool InitializeTracing(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto provider  = sdktrace::TracerProviderFactory::Create(MakeSpanProcessor(observability), MakeResource(config));
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kInternal;
  impl_->span  = g_tracer->StartSpan(std::string(name), options);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_->span) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace autopilot::observability

#endif
