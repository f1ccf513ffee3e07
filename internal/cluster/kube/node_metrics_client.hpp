#pragma once

#include <memory>

#include "internal/cluster/cluster_api.hpp"
#include "http_client.hpp"

namespace coordinator::cluster::kube {

/*
  ClusterApi from three reads: /api/v1/nodes for allocatable capacity,
  metrics.k8s.io for CPU/memory usage and running pods for GPU requests.
*/
class NodeMetricsClient final : public ClusterApi {
 public:
  explicit NodeMetricsClient(std::shared_ptr<KubeHttpClient> client);

  std::vector<coordinator::v1::NodeMetrics> ListNodeMetrics() override;

 private:
  std::shared_ptr<KubeHttpClient> client_;
};

} // namespace coordinator::cluster::kube
