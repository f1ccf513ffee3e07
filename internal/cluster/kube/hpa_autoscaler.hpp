#pragma once

#include <memory>
#include <string>

#include "internal/cluster/autoscaling_api.hpp"
#include "http_client.hpp"

namespace google::protobuf {
class Struct;
}

namespace coordinator::cluster::kube {

/*
  AutoscalingApi over autoscaling/v2 HorizontalPodAutoscalers named
  "<workload>-hpa".

  Directives move the HPA's minReplicas: the HPA keeps reacting to live
  metrics above that floor and is free to shrink once the floor drops.
*/
class HpaAutoscaler final : public AutoscalingApi {
 public:
  HpaAutoscaler(std::shared_ptr<KubeHttpClient> client, std::string ns);

  ScaleStatus GetScale(const std::string& workload) override;
  void        SetDesiredReplicas(const std::string& workload, uint32_t replicas) override;

  static ScaleStatus ParseScale(const std::string& workload, const google::protobuf::Struct& hpa);

 private:
  std::string Path(const std::string& workload) const;

  std::shared_ptr<KubeHttpClient> client_;
  std::string                     namespace_;
};

} // namespace coordinator::cluster::kube
