#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace coordinator::core {
class WorkflowCoordinator;
}
namespace coordinator::db {
class KvStore;
}
namespace coordinator::monitoring {
class MonitoringService;
}
namespace coordinator::scaling {
class HpaEventLogger;
class PredictiveScalingService;
class ScalingDependenciesService;
}
namespace coordinator::scheduling {
class TimerWheel;
class WorkerPool;
}
namespace coordinator::tasks {
class TaskQueueManager;
}

namespace coordinator::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process; optional services are null when their
  feature flag is off.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::KvStore>                         store;
  std::shared_ptr<monitoring::MonitoringService>       monitoring;
  std::shared_ptr<scheduling::WorkerPool>              poll_pool;
  std::shared_ptr<scheduling::WorkerPool>              purge_pool;
  std::shared_ptr<scheduling::TimerWheel>              wheel;
  std::shared_ptr<core::WorkflowCoordinator>           coordinator;
  std::shared_ptr<scaling::PredictiveScalingService>   predictive;
  std::shared_ptr<scaling::ScalingDependenciesService> dependencies;
  std::shared_ptr<scaling::HpaEventLogger>             hpa_logger;
  std::shared_ptr<scheduling::WorkerPool>              task_pool;
  std::shared_ptr<tasks::TaskQueueManager>             tasks;
};

/*
  Build

  Constructs the entire backend based on runtime config and starts the
  background machinery. In-flight workflows from a previous run are
  re-tracked before this returns.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store and cluster types.
*/
Application Build(const coordinator::runtime::config::RuntimeConfig& config);

// Stops the task queue and periodic services, then polling, then monitoring. Call after the server is down.
void Shutdown(Application& app);

} // namespace coordinator::factory
