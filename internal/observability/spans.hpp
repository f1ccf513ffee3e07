#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace coordinator::runtime::config {
class RuntimeConfig;
}

namespace coordinator::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Mirrors the OTel span kinds the coordinator emits.
enum class SpanKind {
  kInternal, // reconcile passes, scaling ticks
  kServer,   // inbound RPCs
  kClient,   // calls to the Kubernetes API
};

struct TracingOptions {
  std::string   service_name{"workflow-coordinator"};
  std::string   service_version{"0.1.0"};
  std::string   kube_namespace{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  double        sample_ratio{1.0};
};

TracingOptions TracingOptionsFromConfig(const coordinator::runtime::config::RuntimeConfig& config);

/*
  Tracing is compiled in only with ENABLE_OTEL. Without it every call
  below is an inline no-op so call sites stay unconditional.

  Root spans are sampled by trace id at the configured ratio; a span
  started under an active parent inherits the parent's decision.
*/
bool InitializeTracing(const coordinator::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  SpanScope

  Starts a span and makes it active on the current thread until the
  scope ends. Scopes on one thread must end in reverse start order.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, SpanKind kind = SpanKind::kInternal);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void SetAttribute(std::string_view key, bool value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const coordinator::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, SpanKind) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::SetAttribute(std::string_view, bool) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace coordinator::observability
