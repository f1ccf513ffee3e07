#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "coordinator/services/v1/coordinator_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace coordinator::grpc {

class AdminServer final : public coordinator::v1::CoordinatorAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<coordinator::service::AdminService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const coordinator::v1::HealthRequest*, coordinator::v1::HealthResponse*) override;
  ::grpc::Status Ready(::grpc::ServerContext*, const coordinator::v1::ReadyRequest*, coordinator::v1::ReadyResponse*) override;
  ::grpc::Status Stats(::grpc::ServerContext*, const coordinator::v1::StatsRequest*, coordinator::v1::StatsResponse*) override;
  ::grpc::Status ScrapeMetrics(::grpc::ServerContext*, const coordinator::v1::ScrapeMetricsRequest*,
                               coordinator::v1::ScrapeMetricsResponse*) override;
  ::grpc::Status RecordScalingSignal(::grpc::ServerContext*, const coordinator::v1::RecordScalingSignalRequest*,
                                     coordinator::v1::RecordScalingSignalResponse*) override;

 private:
  std::shared_ptr<coordinator::service::AdminService> service_;
};

} // namespace coordinator::grpc
