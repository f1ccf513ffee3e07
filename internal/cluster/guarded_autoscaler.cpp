#include "guarded_autoscaler.hpp"

#include "internal/scheduling/circuit_breaker.hpp"

namespace coordinator::cluster {

GuardedAutoscaler::GuardedAutoscaler(std::shared_ptr<AutoscalingApi> inner, std::shared_ptr<scheduling::CircuitBreaker> breaker)
    : inner_(std::move(inner)), breaker_(std::move(breaker)) {
}

ScaleStatus GuardedAutoscaler::GetScale(const std::string& workload) {
  return breaker_->Call([&] { return inner_->GetScale(workload); });
}

void GuardedAutoscaler::SetDesiredReplicas(const std::string& workload, uint32_t replicas) {
  breaker_->Call([&] { inner_->SetDesiredReplicas(workload, replicas); });
}

} // namespace coordinator::cluster
