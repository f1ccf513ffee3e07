#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace coordinator::runtime::config {
class ScalingDependenciesConfig;
}

namespace coordinator::scaling {

struct DependencyEdge {
  std::string workload;
  double      ratio = 1.0;
};

struct DependentWorkload {
  std::string                 name;
  uint32_t                    min_replicas = 1;
  uint32_t                    max_replicas = 0;
  std::vector<DependencyEdge> depends_on;

  // Replica count within [min, max]; max 0 means unbounded.
  uint32_t Clamp(double replicas) const;
};

// One workload reached from a scaling event and the factor it should scale by.
struct PropagationStep {
  std::string workload;
  double      factor = 1.0;
  // longest path from the source
  uint32_t    depth  = 0;
};

/*
  Immutable DAG of "A requires B" edges between workloads. Build()
  validates the whole graph; an instance always describes a DAG whose
  edges point at declared workloads.
*/
class DependencyGraph {
 public:
  DependencyGraph() = default;

  // Throws util::ValidationError for unknown workloads, self edges,
  // non-positive ratios and cycles.
  static DependencyGraph Build(const coordinator::runtime::config::ScalingDependenciesConfig& config);

  const DependentWorkload* Find(const std::string& name) const;

  /*
    Requirements reachable from `source`, deepest first. Each factor is the
    max over its parents p of 1 + (factor(p) - 1) * ratio(p -> node), with
    the source scaled by `source_factor`.
  */
  std::vector<PropagationStep> Propagate(const std::string& source, double source_factor) const;

  std::size_t Size() const {
    return nodes_.size();
  }

 private:
  std::map<std::string, DependentWorkload> nodes_;
};

} // namespace coordinator::scaling
