#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace coordinator::observability {

TracingOptions TracingOptionsFromConfig(const coordinator::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  TracingOptions options;
  if (!observability.service_name().empty()) {
    options.service_name = observability.service_name();
  }
  options.kube_namespace = config.kubernetes().namespace_();
  options.transport      = observability.otlp_transport() == coordinator::runtime::config::OTLP_TRANSPORT_HTTP_PROTOBUF
                               ? OtlpTransport::kHttpProtobuf
                               : OtlpTransport::kGrpc;

  options.endpoint = observability.otlp_endpoint();
  if (options.endpoint.empty()) {
    if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
      options.endpoint = endpoint;
    } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      options.endpoint = endpoint;
    } else {
      options.endpoint = options.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
    }
  }

  const double ratio = observability.trace_sample_ratio();
  if (ratio > 0.0) {
    options.sample_ratio = ratio > 1.0 ? 1.0 : ratio;
  }
  return options;
}

} // namespace coordinator::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

namespace coordinator::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kTracerName = "workflow-coordinator";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;
std::string                                         g_tracer_version;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingOptions& options) {
  if (options.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions http;
    http.url = options.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(http);
  }

  otlp::OtlpGrpcExporterOptions grpc;
  grpc.endpoint            = options.endpoint;
  grpc.use_ssl_credentials = options.endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcExporterFactory::Create(grpc);
}

trace_api::SpanKind ToOtelKind(SpanKind kind) {
  switch (kind) {
    case SpanKind::kServer:
      return trace_api::SpanKind::kServer;
    case SpanKind::kClient:
      return trace_api::SpanKind::kClient;
    case SpanKind::kInternal:
      break;
  }
  return trace_api::SpanKind::kInternal;
}

} // namespace

bool InitializeTracing(const coordinator::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto options = TracingOptionsFromConfig(config);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(options), sdktrace::BatchSpanProcessorOptions{});
  resource::ResourceAttributes attrs = {{"service.name", options.service_name}, {"service.version", options.service_version}};
  if (!options.kube_namespace.empty()) {
    attrs.SetAttribute("k8s.namespace.name", options.kube_namespace);
  }

  std::shared_ptr<sdktrace::Sampler> ratio = sdktrace::TraceIdRatioBasedSamplerFactory::Create(options.sample_ratio);
  auto provider = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs),
                                                          sdktrace::ParentBasedSamplerFactory::Create(ratio));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer_version = options.service_version;
  g_tracer         = g_sdk_provider->GetTracer(kTracerName, g_tracer_version);
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

SpanScope::SpanScope(std::string_view name, SpanKind kind) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  trace_api::StartSpanOptions start;
  start.kind   = ToOtelKind(kind);
  impl_->span  = g_tracer->StartSpan(std::string(name), start);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->span) {
    return;
  }
  // detach before ending so the parent is active again for the next span
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, bool value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace coordinator::observability

#endif
