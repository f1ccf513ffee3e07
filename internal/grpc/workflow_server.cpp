#include "workflow_server.hpp"

#include "grpc_error.hpp"

namespace coordinator::grpc {

using namespace coordinator::v1;

WorkflowServer::WorkflowServer(std::shared_ptr<coordinator::service::WorkflowService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkflowServer::CreateWorkflow(::grpc::ServerContext* ctx, const CreateWorkflowRequest* req, CreateWorkflowResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->CreateWorkflow(*req); });
}

::grpc::Status WorkflowServer::GetWorkflow(::grpc::ServerContext* ctx, const GetWorkflowRequest* req, GetWorkflowResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->GetWorkflow(*req); });
}

::grpc::Status WorkflowServer::CancelWorkflow(::grpc::ServerContext* ctx, const CancelWorkflowRequest* req, CancelWorkflowResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->CancelWorkflow(*req); });
}

::grpc::Status WorkflowServer::ListActiveWorkflows(::grpc::ServerContext* ctx, const ListActiveWorkflowsRequest* req,
                                                   ListActiveWorkflowsResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->ListActiveWorkflows(*req); });
}

::grpc::Status WorkflowServer::InvalidateCache(::grpc::ServerContext* ctx, const InvalidateCacheRequest* req,
                                               InvalidateCacheResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->InvalidateCache(*req); });
}

::grpc::Status WorkflowServer::SubmitTask(::grpc::ServerContext* ctx, const SubmitTaskRequest* req, SubmitTaskResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->SubmitTask(*req); });
}

::grpc::Status WorkflowServer::GetTask(::grpc::ServerContext* ctx, const GetTaskRequest* req, GetTaskResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->GetTask(*req); });
}

::grpc::Status WorkflowServer::CancelTask(::grpc::ServerContext* ctx, const CancelTaskRequest* req, CancelTaskResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->CancelTask(*req); });
}

} // namespace coordinator::grpc
