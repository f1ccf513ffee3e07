#pragma once

#include "coordinator/v1.hpp"
#include "service_context.hpp"

namespace coordinator::service {

class WorkflowService {
 public:
  explicit WorkflowService(ServiceContext ctx);

  coordinator::v1::CreateWorkflowResponse      CreateWorkflow(const coordinator::v1::CreateWorkflowRequest& req);
  coordinator::v1::GetWorkflowResponse         GetWorkflow(const coordinator::v1::GetWorkflowRequest& req);
  coordinator::v1::CancelWorkflowResponse      CancelWorkflow(const coordinator::v1::CancelWorkflowRequest& req);
  coordinator::v1::ListActiveWorkflowsResponse ListActiveWorkflows(const coordinator::v1::ListActiveWorkflowsRequest& req);
  coordinator::v1::InvalidateCacheResponse     InvalidateCache(const coordinator::v1::InvalidateCacheRequest& req);
  coordinator::v1::SubmitTaskResponse          SubmitTask(const coordinator::v1::SubmitTaskRequest& req);
  coordinator::v1::GetTaskResponse             GetTask(const coordinator::v1::GetTaskRequest& req);
  coordinator::v1::CancelTaskResponse          CancelTask(const coordinator::v1::CancelTaskRequest& req);

 private:
  tasks::TaskQueueManager& Tasks();

  ServiceContext ctx_;
};

} // namespace coordinator::service
