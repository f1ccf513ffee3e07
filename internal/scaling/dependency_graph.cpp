#include "dependency_graph.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <set>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace coordinator::scaling {

namespace {

enum class Mark { kNone, kVisiting, kDone };

void DetectCycle(const std::map<std::string, DependentWorkload>& nodes, const std::string& name, std::map<std::string, Mark>& marks,
                 std::vector<std::string>& path) {
  auto& mark = marks[name];
  if (mark == Mark::kDone) return;
  if (mark == Mark::kVisiting) {
    std::string cycle;
    auto        start = std::find(path.begin(), path.end(), name);
    for (auto it = start; it != path.end(); ++it) cycle += *it + " -> ";
    throw util::ValidationError("scaling dependency cycle: " + cycle + name);
  }

  mark = Mark::kVisiting;
  path.push_back(name);
  for (const auto& edge : nodes.at(name).depends_on) {
    DetectCycle(nodes, edge.workload, marks, path);
  }
  path.pop_back();
  marks[name] = Mark::kDone;
}

} // namespace

uint32_t DependentWorkload::Clamp(double replicas) const {
  const uint32_t upper = max_replicas == 0 ? std::numeric_limits<uint32_t>::max() : max_replicas;
  // bounded before the cast; an out-of-range double to integer conversion is undefined
  if (std::isnan(replicas) || replicas <= static_cast<double>(min_replicas)) return min_replicas;
  if (replicas >= static_cast<double>(upper)) return upper;
  return static_cast<uint32_t>(replicas);
}

DependencyGraph DependencyGraph::Build(const coordinator::runtime::config::ScalingDependenciesConfig& config) {
  DependencyGraph graph;

  for (const auto& w : config.workloads()) {
    if (w.name().empty()) {
      throw util::ValidationError("scaling_dependencies.workloads: name is required");
    }
    DependentWorkload node;
    node.name         = w.name();
    node.min_replicas = w.min_replicas() > 0 ? w.min_replicas() : 1;
    node.max_replicas = w.max_replicas();
    if (node.max_replicas != 0 && node.max_replicas < node.min_replicas) {
      throw util::ValidationError("scaling_dependencies.workloads[" + w.name() + "]: max_replicas below min_replicas");
    }
    for (const auto& r : w.depends_on()) {
      if (r.workload() == w.name()) {
        throw util::ValidationError("scaling_dependencies.workloads[" + w.name() + "]: workload cannot require itself");
      }
      if (!(r.ratio() > 0.0)) {
        throw util::ValidationError("scaling_dependencies.workloads[" + w.name() + "]: ratio for " + r.workload() + " must be positive");
      }
      node.depends_on.push_back({r.workload(), r.ratio()});
    }
    if (!graph.nodes_.emplace(node.name, node).second) {
      throw util::ValidationError("scaling_dependencies.workloads: duplicate workload " + w.name());
    }
  }

  for (const auto& [name, node] : graph.nodes_) {
    for (const auto& edge : node.depends_on) {
      if (!graph.nodes_.count(edge.workload)) {
        throw util::ValidationError("scaling_dependencies.workloads[" + name + "]: unknown workload " + edge.workload);
      }
    }
  }

  std::map<std::string, Mark> marks;
  std::vector<std::string>    path;
  for (const auto& [name, node] : graph.nodes_) {
    DetectCycle(graph.nodes_, name, marks, path);
  }
  return graph;
}

const DependentWorkload* DependencyGraph::Find(const std::string& name) const {
  auto it = nodes_.find(name);
  return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<PropagationStep> DependencyGraph::Propagate(const std::string& source, double source_factor) const {
  const auto* root = Find(source);
  if (!root) return {};

  // reachable subgraph
  std::set<std::string>   reachable{source};
  std::queue<std::string> frontier;
  frontier.push(source);
  while (!frontier.empty()) {
    const auto name = frontier.front();
    frontier.pop();
    for (const auto& edge : nodes_.at(name).depends_on) {
      if (reachable.insert(edge.workload).second) frontier.push(edge.workload);
    }
  }

  // Kahn over the reachable nodes
  std::map<std::string, uint32_t> in_degree;
  for (const auto& name : reachable) in_degree[name];
  for (const auto& name : reachable) {
    for (const auto& edge : nodes_.at(name).depends_on) ++in_degree[edge.workload];
  }

  std::queue<std::string> ready;
  ready.push(source);
  std::map<std::string, double>   factor{{source, source_factor}};
  std::map<std::string, uint32_t> depth{{source, 0}};
  std::vector<std::string>        order;

  while (!ready.empty()) {
    const auto name = ready.front();
    ready.pop();
    order.push_back(name);

    for (const auto& edge : nodes_.at(name).depends_on) {
      const double candidate = 1.0 + (factor[name] - 1.0) * edge.ratio;
      auto         it        = factor.find(edge.workload);
      if (it == factor.end()) {
        factor.emplace(edge.workload, candidate);
      } else {
        it->second = std::max(it->second, candidate);
      }
      depth[edge.workload] = std::max(depth[edge.workload], depth[name] + 1);

      if (--in_degree[edge.workload] == 0) ready.push(edge.workload);
    }
  }

  std::vector<PropagationStep> steps;
  for (const auto& name : order) {
    if (name == source) continue;
    steps.push_back({name, factor[name], depth[name]});
  }
  std::stable_sort(steps.begin(), steps.end(), [](const PropagationStep& a, const PropagationStep& b) { return a.depth > b.depth; });
  return steps;
}

} // namespace coordinator::scaling
