#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "coordinator/services/v1/workflow_coordinator_service.grpc.pb.h"
#include "internal/service/workflow_service.hpp"

namespace coordinator::grpc {

class WorkflowServer final : public coordinator::v1::WorkflowCoordinatorService::Service {
 public:
  explicit WorkflowServer(std::shared_ptr<coordinator::service::WorkflowService> svc);

  ::grpc::Status CreateWorkflow(::grpc::ServerContext*, const coordinator::v1::CreateWorkflowRequest*,
                                coordinator::v1::CreateWorkflowResponse*) override;
  ::grpc::Status GetWorkflow(::grpc::ServerContext*, const coordinator::v1::GetWorkflowRequest*, coordinator::v1::GetWorkflowResponse*) override;
  ::grpc::Status CancelWorkflow(::grpc::ServerContext*, const coordinator::v1::CancelWorkflowRequest*,
                                coordinator::v1::CancelWorkflowResponse*) override;
  ::grpc::Status ListActiveWorkflows(::grpc::ServerContext*, const coordinator::v1::ListActiveWorkflowsRequest*,
                                     coordinator::v1::ListActiveWorkflowsResponse*) override;
  ::grpc::Status InvalidateCache(::grpc::ServerContext*, const coordinator::v1::InvalidateCacheRequest*,
                                 coordinator::v1::InvalidateCacheResponse*) override;
  ::grpc::Status SubmitTask(::grpc::ServerContext*, const coordinator::v1::SubmitTaskRequest*, coordinator::v1::SubmitTaskResponse*) override;
  ::grpc::Status GetTask(::grpc::ServerContext*, const coordinator::v1::GetTaskRequest*, coordinator::v1::GetTaskResponse*) override;
  ::grpc::Status CancelTask(::grpc::ServerContext*, const coordinator::v1::CancelTaskRequest*, coordinator::v1::CancelTaskResponse*) override;

 private:
  std::shared_ptr<coordinator::service::WorkflowService> service_;
};

} // namespace coordinator::grpc
