#include "node_metrics_client.hpp"

#include <google/protobuf/struct.pb.h>

#include <map>
#include <string>

#include "internal/resources/quantity.hpp"
#include "json.hpp"

namespace coordinator::cluster::kube {

namespace {

struct Usage {
  int64_t cpu_millis   = 0;
  int64_t memory_bytes = 0;
  int64_t gpus         = 0;
};

const google::protobuf::ListValue* Items(const google::protobuf::Struct& list) {
  const auto* items = Find(list, {"items"});
  return items && items->has_list_value() ? &items->list_value() : nullptr;
}

} // namespace

NodeMetricsClient::NodeMetricsClient(std::shared_ptr<KubeHttpClient> client) : client_(std::move(client)) {
}

std::vector<coordinator::v1::NodeMetrics> NodeMetricsClient::ListNodeMetrics() {
  auto nodes_response = client_->Request("GET", "/api/v1/nodes");
  KubeHttpClient::ThrowForStatus(nodes_response, "list nodes");
  auto usage_response = client_->Request("GET", "/apis/metrics.k8s.io/v1beta1/nodes");
  KubeHttpClient::ThrowForStatus(usage_response, "list node metrics");
  auto pods_response = client_->Request("GET", "/api/v1/pods?fieldSelector=status.phase%3DRunning");
  KubeHttpClient::ThrowForStatus(pods_response, "list running pods");

  std::map<std::string, Usage> usage;

  const auto usage_list = ParseObject(usage_response.body);
  if (const auto* items = Items(usage_list)) {
    for (const auto& item : items->values()) {
      if (!item.has_struct_value()) continue;
      const auto& obj  = item.struct_value();
      auto&       slot = usage[GetString(obj, {"metadata", "name"})];
      slot.cpu_millis   = resources::ParseCpuMillis(GetString(obj, {"usage", "cpu"}, "0"));
      slot.memory_bytes = resources::ParseMemoryBytes(GetString(obj, {"usage", "memory"}, "0"));
    }
  }

  const auto pod_list = ParseObject(pods_response.body);
  if (const auto* items = Items(pod_list)) {
    for (const auto& item : items->values()) {
      if (!item.has_struct_value()) continue;
      const auto& pod       = item.struct_value();
      const auto  node_name = GetString(pod, {"spec", "nodeName"});
      const auto* containers = Find(pod, {"spec", "containers"});
      if (node_name.empty() || !containers || !containers->has_list_value()) continue;

      for (const auto& container : containers->list_value().values()) {
        if (!container.has_struct_value()) continue;
        usage[node_name].gpus += static_cast<int64_t>(
            resources::ParseCount(GetString(container.struct_value(), {"resources", "requests", "nvidia.com/gpu"}, "0")));
      }
    }
  }

  std::vector<coordinator::v1::NodeMetrics> result;
  const auto                                node_list = ParseObject(nodes_response.body);
  if (const auto* items = Items(node_list)) {
    for (const auto& item : items->values()) {
      if (!item.has_struct_value()) continue;
      const auto& node = item.struct_value();

      coordinator::v1::NodeMetrics metrics;
      metrics.set_name(GetString(node, {"metadata", "name"}));

      const auto cpu_capacity    = resources::ParseCpuMillis(GetString(node, {"status", "allocatable", "cpu"}, "0"));
      const auto memory_capacity = resources::ParseMemoryBytes(GetString(node, {"status", "allocatable", "memory"}, "0"));
      const auto gpu_capacity    = resources::ParseCount(GetString(node, {"status", "allocatable", "nvidia.com/gpu"}, "0"));

      const auto& used = usage[metrics.name()];
      metrics.set_cpu_usage(cpu_capacity > 0 ? static_cast<double>(used.cpu_millis) / static_cast<double>(cpu_capacity) : 0.0);
      metrics.set_memory_usage(memory_capacity > 0 ? static_cast<double>(used.memory_bytes) / static_cast<double>(memory_capacity) : 0.0);
      metrics.set_gpu_capacity(static_cast<uint32_t>(gpu_capacity));
      metrics.set_gpu_used(static_cast<uint32_t>(used.gpus));

      if (const auto* labels = Find(node, {"metadata", "labels"}); labels && labels->has_struct_value()) {
        for (const auto& [key, value] : labels->struct_value().fields()) {
          if (value.has_string_value()) (*metrics.mutable_labels())[key] = value.string_value();
        }
      }
      result.push_back(std::move(metrics));
    }
  }

  return result;
}

} // namespace coordinator::cluster::kube
