#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace coordinator::grpc {

using namespace coordinator::v1;

AdminServer::AdminServer(std::shared_ptr<coordinator::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Health(::grpc::ServerContext* ctx, const HealthRequest* req, HealthResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->Health(*req); });
}

::grpc::Status AdminServer::Ready(::grpc::ServerContext* ctx, const ReadyRequest* req, ReadyResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->Ready(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext* ctx, const StatsRequest* req, StatsResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::ScrapeMetrics(::grpc::ServerContext* ctx, const ScrapeMetricsRequest* req, ScrapeMetricsResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->ScrapeMetrics(*req); });
}

::grpc::Status AdminServer::RecordScalingSignal(::grpc::ServerContext* ctx, const RecordScalingSignalRequest* req,
                                                RecordScalingSignalResponse* resp) {
  return ServeUnary(ctx, [&] { *resp = service_->RecordScalingSignal(*req); });
}

} // namespace coordinator::grpc
