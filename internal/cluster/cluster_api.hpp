#pragma once

#include <vector>

#include "coordinator/core/v1/workflow.pb.h"

namespace coordinator::cluster {

/*
  Node capacity and usage. Usage fields of NodeMetrics are ratios in [0,1].
*/
class ClusterApi {
 public:
  virtual ~ClusterApi() = default;

  virtual std::vector<coordinator::v1::NodeMetrics> ListNodeMetrics() = 0;
};

} // namespace coordinator::cluster
