#include "scaling_dependencies_service.hpp"

#include <cmath>
#include <mutex>

#include "internal/cluster/autoscaling_api.hpp"
#include "internal/model/names.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace coordinator::scaling {

ScalingDependenciesService::ScalingDependenciesService(DependencyGraph graph, const coordinator::runtime::config::ScalingDependenciesConfig& config,
                                                       std::shared_ptr<cluster::AutoscalingApi>       autoscaler,
                                                       std::shared_ptr<monitoring::MonitoringService> monitoring,
                                                       std::shared_ptr<db::KvStore> store, scheduling::RetryPolicy::Sleeper sleeper)
    : graph_(std::make_shared<const DependencyGraph>(std::move(graph))),
      retry_(scheduling::RetryOptions::FromConfig(config.retry()), std::move(sleeper)),
      autoscaler_(std::move(autoscaler)),
      monitoring_(std::move(monitoring)),
      decisions_(std::move(store)) {
}

std::shared_ptr<const DependencyGraph> ScalingDependenciesService::Graph() const {
  std::shared_lock lock(graph_mutex_);
  return graph_;
}

void ScalingDependenciesService::Reload(const coordinator::runtime::config::ScalingDependenciesConfig& config) {
  auto graph = std::make_shared<const DependencyGraph>(DependencyGraph::Build(config));

  std::unique_lock lock(graph_mutex_);
  graph_ = std::move(graph);
  COORDINATOR_LOG_INFO("scaling dependencies reloaded", {observability::IntField("workloads", static_cast<int64_t>(graph_->Size()))});
}

void ScalingDependenciesService::OnScalingEvent(const std::string& workload, uint32_t old_replicas, uint32_t new_replicas) {
  const auto   graph  = Graph();
  const double factor = static_cast<double>(new_replicas) / static_cast<double>(std::max<uint32_t>(old_replicas, 1));

  const auto steps = graph->Propagate(workload, factor);
  if (steps.empty()) return;

  COORDINATOR_LOG_INFO("propagating scaling event",
                       {observability::StringField("workload", workload), observability::DoubleField("factor", factor),
                        observability::IntField("dependencies", static_cast<int64_t>(steps.size()))});

  for (const auto& step : steps) {
    const auto* node = graph->Find(step.workload);
    if (!node) continue;
    try {
      ScaleDependency(*node, step, workload);
    } catch (const std::exception& e) {
      COORDINATOR_LOG_ERROR("dependency scaling failed",
                            {observability::StringField("workload", step.workload), observability::StringField("trigger", workload),
                             observability::StringField("error", e.what())});
      if (monitoring_) monitoring_->RecordScalingError(step.workload, coordinator::v1::SCALING_SOURCE_DEPENDENCY);
    }
  }
}

void ScalingDependenciesService::ScaleDependency(const DependentWorkload& node, const PropagationStep& step, const std::string& trigger) {
  const auto     status  = retry_.Execute("get scale", [&] { return autoscaler_->GetScale(node.name); });
  const uint32_t current = std::max<uint32_t>(status.current_replicas, 1);
  const uint32_t target  = node.Clamp(std::ceil(static_cast<double>(current) * step.factor));
  if (target == status.current_replicas) return;

  retry_.Execute("set desired replicas", [&] { autoscaler_->SetDesiredReplicas(node.name, target); });

  coordinator::v1::ScalingDecision decision;
  decision.set_workload(node.name);
  decision.set_direction(target > status.current_replicas ? coordinator::v1::SCALING_DIRECTION_UP : coordinator::v1::SCALING_DIRECTION_DOWN);
  decision.set_source(coordinator::v1::SCALING_SOURCE_DEPENDENCY);
  decision.set_replicas_before(status.current_replicas);
  decision.set_replicas_after(target);
  decision.set_timestamp_ms(util::NowMillis());
  decision.set_trigger(trigger);

  COORDINATOR_LOG_INFO("dependency scaled",
                       {observability::StringField("workload", node.name), observability::StringField("trigger", trigger),
                        observability::StringField("direction", model::ToString(decision.direction())),
                        observability::DoubleField("factor", step.factor), observability::IntField("replicas_before", status.current_replicas),
                        observability::IntField("replicas_after", target)});

  decisions_.Append(decision);
  if (monitoring_) monitoring_->RecordScalingDecision(decision);
}

} // namespace coordinator::scaling
