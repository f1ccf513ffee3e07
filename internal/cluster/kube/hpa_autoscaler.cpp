#include "hpa_autoscaler.hpp"

#include <google/protobuf/struct.pb.h>

#include "json.hpp"

namespace coordinator::cluster::kube {

HpaAutoscaler::HpaAutoscaler(std::shared_ptr<KubeHttpClient> client, std::string ns) : client_(std::move(client)), namespace_(std::move(ns)) {
  if (namespace_.empty()) namespace_ = "default";
}

std::string HpaAutoscaler::Path(const std::string& workload) const {
  return "/apis/autoscaling/v2/namespaces/" + namespace_ + "/horizontalpodautoscalers/" + workload + "-hpa";
}

ScaleStatus HpaAutoscaler::ParseScale(const std::string& workload, const google::protobuf::Struct& hpa) {
  ScaleStatus status;
  status.workload         = workload;
  status.min_replicas     = static_cast<uint32_t>(GetNumber(hpa, {"spec", "minReplicas"}, 1));
  status.max_replicas     = static_cast<uint32_t>(GetNumber(hpa, {"spec", "maxReplicas"}, status.min_replicas));
  status.current_replicas = static_cast<uint32_t>(GetNumber(hpa, {"status", "currentReplicas"}));
  status.desired_replicas = static_cast<uint32_t>(GetNumber(hpa, {"status", "desiredReplicas"}, status.current_replicas));

  // first resource metric is reported as the trigger
  const auto* current = Find(hpa, {"status", "currentMetrics"});
  if (current && current->has_list_value() && current->list_value().values_size() > 0) {
    const auto& first = current->list_value().values(0);
    if (first.has_struct_value()) {
      const auto& metric    = first.struct_value();
      status.trigger_metric = GetString(metric, {"resource", "name"}, GetString(metric, {"type"}));
      status.trigger_value  = GetNumber(metric, {"resource", "current", "averageUtilization"});
    }
  }

  const auto* targets = Find(hpa, {"spec", "metrics"});
  if (targets && targets->has_list_value()) {
    for (const auto& target : targets->list_value().values()) {
      if (!target.has_struct_value()) continue;
      const auto& metric = target.struct_value();
      if (GetString(metric, {"resource", "name"}) == status.trigger_metric) {
        status.trigger_threshold = GetNumber(metric, {"resource", "target", "averageUtilization"});
        break;
      }
    }
  }

  return status;
}

ScaleStatus HpaAutoscaler::GetScale(const std::string& workload) {
  const auto response = client_->Request("GET", Path(workload));
  KubeHttpClient::ThrowForStatus(response, "get hpa " + workload);
  return ParseScale(workload, ParseObject(response.body));
}

void HpaAutoscaler::SetDesiredReplicas(const std::string& workload, uint32_t replicas) {
  // moving the floor forces the replica count; the HPA still scales above it
  const auto body     = R"({"spec":{"minReplicas":)" + std::to_string(replicas) + "}}";
  const auto response = client_->Request("PATCH", Path(workload), body, "application/merge-patch+json");
  KubeHttpClient::ThrowForStatus(response, "patch hpa " + workload);
}

} // namespace coordinator::cluster::kube
