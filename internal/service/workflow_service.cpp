#include "workflow_service.hpp"

#include "internal/cache/cache_manager.hpp"
#include "internal/core/workflow_coordinator.hpp"
#include "internal/tasks/task_queue_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace coordinator::service {

using namespace coordinator::v1;

namespace {

void RequireWorkflowId(const std::string& workflow_id, std::string_view route) {
  if (workflow_id.empty()) {
    throw util::ValidationError(std::string(route) + ": workflow_id is required");
  }
}

void RequireTaskId(const std::string& task_id, std::string_view route) {
  if (task_id.empty()) {
    throw util::ValidationError(std::string(route) + ": task_id is required");
  }
}

} // namespace

WorkflowService::WorkflowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateWorkflowResponse WorkflowService::CreateWorkflow(const CreateWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.CreateWorkflow", {}, [&] {
    auto result = ctx_.coordinator->CreateWorkflow(req.request());

    CreateWorkflowResponse resp;
    resp.set_workflow_id(result.workflow_id);
    *resp.mutable_status() = std::move(result.status);
    resp.set_cache_hit(result.cache_hit);
    return resp;
  });
}

GetWorkflowResponse WorkflowService::GetWorkflow(const GetWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.GetWorkflow", req.workflow_id(), [&] {
    RequireWorkflowId(req.workflow_id(), "get workflow");
    GetWorkflowResponse resp;
    *resp.mutable_status() = ctx_.coordinator->GetWorkflow(req.workflow_id());
    return resp;
  });
}

CancelWorkflowResponse WorkflowService::CancelWorkflow(const CancelWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.CancelWorkflow", req.workflow_id(), [&] {
    RequireWorkflowId(req.workflow_id(), "cancel workflow");
    CancelWorkflowResponse resp;
    *resp.mutable_status() = ctx_.coordinator->CancelWorkflow(req.workflow_id());
    return resp;
  });
}

ListActiveWorkflowsResponse WorkflowService::ListActiveWorkflows(const ListActiveWorkflowsRequest& req) {
  return ObserveRpc("WorkflowService.ListActiveWorkflows", {}, [&] {
    ListActiveWorkflowsResponse resp;
    for (auto& status : ctx_.coordinator->ListActiveWorkflows(req.user_id())) {
      *resp.add_workflows() = std::move(status);
    }
    return resp;
  });
}

InvalidateCacheResponse WorkflowService::InvalidateCache(const InvalidateCacheRequest& req) {
  return ObserveRpc("WorkflowService.InvalidateCache", {}, [&] {
    InvalidateCacheResponse resp;
    switch (req.target_case()) {
      case InvalidateCacheRequest::kCacheKey:
        if (req.cache_key().empty()) throw util::ValidationError("invalidate cache: cache_key is empty");
        resp.set_removed(ctx_.cache->Invalidate(req.cache_key()));
        break;
      case InvalidateCacheRequest::kWorkflowType:
        if (req.workflow_type().empty()) throw util::ValidationError("invalidate cache: workflow_type is empty");
        resp.set_removed(ctx_.cache->InvalidateByType(req.workflow_type()));
        break;
      case InvalidateCacheRequest::TARGET_NOT_SET:
        throw util::ValidationError("invalidate cache: cache_key or workflow_type is required");
    }
    return resp;
  });
}

tasks::TaskQueueManager& WorkflowService::Tasks() {
  if (!ctx_.tasks) throw util::TransientInfraError("task queue is disabled");
  return *ctx_.tasks;
}

SubmitTaskResponse WorkflowService::SubmitTask(const SubmitTaskRequest& req) {
  return ObserveRpc("WorkflowService.SubmitTask", {}, [&] {
    SubmitTaskResponse resp;
    *resp.mutable_task() = Tasks().Submit(req.request());
    return resp;
  });
}

GetTaskResponse WorkflowService::GetTask(const GetTaskRequest& req) {
  return ObserveRpc("WorkflowService.GetTask", {}, [&] {
    RequireTaskId(req.task_id(), "get task");
    GetTaskResponse resp;
    *resp.mutable_task() = Tasks().Get(req.task_id());
    return resp;
  });
}

CancelTaskResponse WorkflowService::CancelTask(const CancelTaskRequest& req) {
  return ObserveRpc("WorkflowService.CancelTask", {}, [&] {
    RequireTaskId(req.task_id(), "cancel task");
    CancelTaskResponse resp;
    *resp.mutable_task() = Tasks().Cancel(req.task_id());
    return resp;
  });
}

} // namespace coordinator::service
