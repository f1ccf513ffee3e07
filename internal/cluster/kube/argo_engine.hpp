#pragma once

#include <memory>
#include <string>

#include "internal/cluster/execution_engine.hpp"
#include "http_client.hpp"

namespace google::protobuf {
class Struct;
}

namespace coordinator::cluster::kube {

/*
  ExecutionEngine backed by Argo Workflows custom resources.

  Jobs become Workflow objects referencing a WorkflowTemplate named after
  the request type; placement and resources go into templateDefaults.
*/
class ArgoEngine final : public ExecutionEngine {
 public:
  ArgoEngine(std::shared_ptr<KubeHttpClient> client, std::string ns);

  void                 Submit(const JobTemplate& job) override;
  EngineWorkflowStatus Poll(const std::string& workflow_id) override;
  void                 Terminate(const std::string& workflow_id) override;

  // Exposed for tests.
  static google::protobuf::Struct BuildManifest(const JobTemplate& job, const std::string& ns);
  static EngineWorkflowStatus     ParseStatus(const google::protobuf::Struct& workflow);

 private:
  std::string CollectionPath() const;

  std::shared_ptr<KubeHttpClient> client_;
  std::string                     namespace_;
};

} // namespace coordinator::cluster::kube
