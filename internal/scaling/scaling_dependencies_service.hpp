#pragma once

#include <memory>
#include <shared_mutex>
#include <string>

#include "config/config.pb.h"
#include "decision_log.hpp"
#include "dependency_graph.hpp"
#include "internal/scheduling/retry_policy.hpp"
#include "scaling_listener.hpp"

namespace coordinator::cluster {
class AutoscalingApi;
}
namespace coordinator::monitoring {
class MonitoringService;
}

namespace coordinator::scaling {

/*
  Carries a scaling event on one workload over to the workloads it
  requires, so that a backend gains replicas before its callers do.

  A failed directive is logged and counted; the remaining workloads are
  still processed.
*/
class ScalingDependenciesService final : public ScalingListener {
 public:
  ScalingDependenciesService(DependencyGraph graph, const coordinator::runtime::config::ScalingDependenciesConfig& config,
                             std::shared_ptr<cluster::AutoscalingApi> autoscaler, std::shared_ptr<monitoring::MonitoringService> monitoring,
                             std::shared_ptr<db::KvStore> store, scheduling::RetryPolicy::Sleeper sleeper = {});

  void OnScalingEvent(const std::string& workload, uint32_t old_replicas, uint32_t new_replicas) override;

  // Validates first; the running graph is untouched when validation fails.
  void Reload(const coordinator::runtime::config::ScalingDependenciesConfig& config);

  std::shared_ptr<const DependencyGraph> Graph() const;

 private:
  void ScaleDependency(const DependentWorkload& node, const PropagationStep& step, const std::string& trigger);

  mutable std::shared_mutex              graph_mutex_;
  std::shared_ptr<const DependencyGraph> graph_;

  scheduling::RetryPolicy                        retry_;
  std::shared_ptr<cluster::AutoscalingApi>       autoscaler_;
  std::shared_ptr<monitoring::MonitoringService> monitoring_;
  DecisionLog                                    decisions_;
};

} // namespace coordinator::scaling
