#pragma once

#include <memory>

#include "autoscaling_api.hpp"

namespace coordinator::scheduling {
class CircuitBreaker;
}

namespace coordinator::cluster {

/*
  Routes every autoscaling call through a circuit breaker, so a dead API
  server costs one fast TransientInfraError per call instead of a timeout.
*/
class GuardedAutoscaler final : public AutoscalingApi {
 public:
  GuardedAutoscaler(std::shared_ptr<AutoscalingApi> inner, std::shared_ptr<scheduling::CircuitBreaker> breaker);

  ScaleStatus GetScale(const std::string& workload) override;
  void        SetDesiredReplicas(const std::string& workload, uint32_t replicas) override;

 private:
  std::shared_ptr<AutoscalingApi>             inner_;
  std::shared_ptr<scheduling::CircuitBreaker> breaker_;
};

} // namespace coordinator::cluster
