#pragma once

#include <cstdint>
#include <string>

namespace coordinator::cluster {

struct ScaleStatus {
  std::string workload;
  uint32_t    current_replicas = 0;
  uint32_t    desired_replicas = 0;
  uint32_t    min_replicas     = 0;
  uint32_t    max_replicas     = 0;
  std::string trigger_metric;
  double      trigger_value     = 0.0;
  double      trigger_threshold = 0.0;
};

/*
  Desired-replica directives per workload. Same error contract as
  ExecutionEngine.
*/
class AutoscalingApi {
 public:
  virtual ~AutoscalingApi() = default;

  virtual ScaleStatus GetScale(const std::string& workload)                         = 0;
  virtual void        SetDesiredReplicas(const std::string& workload, uint32_t replicas) = 0;
};

} // namespace coordinator::cluster
