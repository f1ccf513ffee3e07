#pragma once

#include "coordinator/v1.hpp"
#include "service_context.hpp"

namespace coordinator::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  coordinator::v1::HealthResponse Health(const coordinator::v1::HealthRequest& req);

  // Ready when the store answers and the engine circuit is not open.
  coordinator::v1::ReadyResponse Ready(const coordinator::v1::ReadyRequest& req);

  // Monitoring stats plus the cluster view when resources are wired.
  coordinator::v1::StatsResponse         Stats(const coordinator::v1::StatsRequest& req);
  coordinator::v1::ScrapeMetricsResponse ScrapeMetrics(const coordinator::v1::ScrapeMetricsRequest& req);

  coordinator::v1::RecordScalingSignalResponse RecordScalingSignal(const coordinator::v1::RecordScalingSignalRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace coordinator::service
