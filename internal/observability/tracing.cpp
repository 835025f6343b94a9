#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace rollout::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;
namespace cfg       = rollout::runtime::config;

namespace {

// Set once by InitializeTracing; spans opened before that (or after
// Shutdown) fall back to whatever global provider is installed.
struct TracingState {
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
  std::string                                         controller_id;
};

TracingState g_tracing;

constexpr const char* kTracerName    = "rollout.controller";
constexpr const char* kTracerVersion = "0.1.0";

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const cfg::ObservabilityConfig::TracingConfig& tracing,
                                                       std::unique_ptr<sdktrace::SpanExporter>         exporter) {
  if (tracing.processor() == cfg::ObservabilityConfig::TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  // rollouts emit few, long spans; zero keeps the SDK default
  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

std::unique_ptr<sdktrace::Sampler> MakeSampler(cfg::ObservabilityConfig::TracingConfig::TraceHint hint) {
  switch (hint) {
    case cfg::ObservabilityConfig::TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case cfg::ObservabilityConfig::TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return nullptr;
  }
}

resource::Resource MakeResource(const OtlpConfig& config, const std::string& controller_id) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", kTracerVersion}};
  if (!controller_id.empty()) attrs.SetAttribute("service.instance.id", opentelemetry::nostd::string_view(controller_id));
  return resource::Resource::Create(attrs);
}

} // namespace

bool InitializeTracing(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == cfg::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto processor = MakeProcessor(observability.tracing(), MakeExporter(otlp_config));
  auto resource  = MakeResource(otlp_config, config.controller().controller_id());
  auto sampler   = MakeSampler(observability.tracing().trace_hint());

  std::unique_ptr<sdktrace::TracerProvider> provider =
      sampler ? sdktrace::TracerProviderFactory::Create(std::move(processor), resource, std::move(sampler))
              : sdktrace::TracerProviderFactory::Create(std::move(processor), resource);

  g_tracing.provider      = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  g_tracing.controller_id = config.controller().controller_id();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracing.provider));
  g_tracing.tracer = g_tracing.provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracing.tracer);
}

void ShutdownTracing() {
  if (g_tracing.provider) {
    g_tracing.provider->ForceFlush();
    g_tracing.provider->Shutdown();
  }
  g_tracing = TracingState{};
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracing.tracer;
  if (!tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) tracer = provider->GetTracer(kTracerName, kTracerVersion);
  }
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  if (!g_tracing.controller_id.empty()) impl_->span->SetAttribute("rollout.controller_id", g_tracing.controller_id);
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

// Marks the span failed; rollout errors arrive as exception messages.
void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace rollout::observability

#endif
