#include "admin_service.hpp"

#include "internal/db/api/kv_store.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/scaling/predictive_scaling_service.hpp"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace coordinator::service {

using namespace coordinator::v1;

namespace {

constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4";

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse AdminService::Health(const HealthRequest&) {
  HealthResponse resp;
  resp.set_ok(true);
  resp.set_status("serving");
  return resp;
}

ReadyResponse AdminService::Ready(const ReadyRequest&) {
  return ObserveRpc("AdminService.Ready", {}, [&] {
    ReadyResponse resp;

    if (auto res = ctx_.store->Ping(); !res) {
      resp.add_reasons("store: " + res.message);
    }
    if (ctx_.engine_breaker && ctx_.engine_breaker->CurrentState() == scheduling::CircuitBreaker::State::kOpen) {
      resp.add_reasons(ctx_.engine_breaker->Name() + ": circuit open");
    }

    resp.set_ready(resp.reasons_size() == 0);
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", {}, [&] {
    auto resp = ctx_.monitoring->GetStats();
    if (ctx_.resources) {
      *resp.mutable_utilization() = ctx_.resources->GetResourceUtilization();
      for (auto& node : ctx_.resources->GetNodeMetrics()) *resp.add_nodes() = std::move(node);
      resp.set_under_high_load(ctx_.resources->IsUnderHighLoad());
    }
    return resp;
  });
}

ScrapeMetricsResponse AdminService::ScrapeMetrics(const ScrapeMetricsRequest&) {
  return ObserveRpc("AdminService.ScrapeMetrics", {}, [&] {
    ScrapeMetricsResponse resp;
    resp.set_content_type(kPrometheusContentType);
    resp.set_body(ctx_.monitoring->Scrape());
    return resp;
  });
}

RecordScalingSignalResponse AdminService::RecordScalingSignal(const RecordScalingSignalRequest& req) {
  return ObserveRpc("AdminService.RecordScalingSignal", {}, [&] {
    if (!ctx_.predictive) {
      throw util::InvalidState("record scaling signal: predictive scaling is disabled");
    }
    if (!req.has_signal()) {
      throw util::ValidationError("record scaling signal: signal is required");
    }
    ctx_.predictive->RecordSignal(req.signal());
    return RecordScalingSignalResponse{};
  });
}

} // namespace coordinator::service
