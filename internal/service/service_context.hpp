#pragma once

#include <memory>

namespace coordinator::core {
class WorkflowCoordinator;
}
namespace coordinator::cache {
class CacheManager;
}
namespace coordinator::monitoring {
class MonitoringService;
}
namespace coordinator::resources {
class ResourceManager;
}
namespace coordinator::scaling {
class PredictiveScalingService;
}
namespace coordinator::scheduling {
class CircuitBreaker;
}
namespace coordinator::db {
class KvStore;
}
namespace coordinator::tasks {
class TaskQueueManager;
}

namespace coordinator::service {

/*
  Dependency container shared by all services.

  predictive and tasks are null when their features are disabled;
  resources may be null when no cluster view is wanted in stats.
*/
struct ServiceContext {
  std::shared_ptr<coordinator::core::WorkflowCoordinator>        coordinator;
  std::shared_ptr<coordinator::cache::CacheManager>              cache;
  std::shared_ptr<coordinator::monitoring::MonitoringService>    monitoring;
  std::shared_ptr<coordinator::resources::ResourceManager>       resources;
  std::shared_ptr<coordinator::scaling::PredictiveScalingService> predictive;
  std::shared_ptr<coordinator::scheduling::CircuitBreaker>       engine_breaker;
  std::shared_ptr<coordinator::db::KvStore>                      store;
  std::shared_ptr<coordinator::tasks::TaskQueueManager>          tasks;
};

} // namespace coordinator::service
