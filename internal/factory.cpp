#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache_manager.hpp"
#include "internal/cluster/guarded_autoscaler.hpp"
#include "internal/cluster/kube/argo_engine.hpp"
#include "internal/cluster/kube/hpa_autoscaler.hpp"
#include "internal/cluster/kube/http_client.hpp"
#include "internal/cluster/kube/node_metrics_client.hpp"
#include "internal/core/workflow_coordinator.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/workflow_server.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quality/quality_manager.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/scaling/dependency_graph.hpp"
#include "internal/scaling/hpa_event_logger.hpp"
#include "internal/scaling/predictive_scaling_service.hpp"
#include "internal/scaling/scaling_dependencies_service.hpp"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/scheduling/timer_wheel.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/workflow_service.hpp"
#include "internal/tasks/task_queue_manager.hpp"
#include "internal/workflow/workflow_store.hpp"

namespace coordinator::factory {

using namespace coordinator;

namespace {

constexpr std::size_t kDefaultPollWorkers  = 4;
constexpr std::size_t kDefaultPurgeWorkers = 1;
constexpr std::size_t kDefaultTimerSlots   = 512;
constexpr std::size_t kDefaultTaskWorkers  = 4;

std::shared_ptr<db::KvStore> BuildStore(const coordinator::runtime::config::RuntimeConfig& config) {
  const auto& store = config.store();
  if (store.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path());
    db::sqlite::SqliteStore::BootstrapSchema(*sqlite_db);
    COORDINATOR_LOG_INFO("using sqlite store", {observability::StringField("path", store.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteStore>(std::move(sqlite_db));
  }

  COORDINATOR_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryStore>();
}

std::shared_ptr<scheduling::CircuitBreaker> BuildBreaker(std::string name, const coordinator::runtime::config::CircuitBreakerConfig& config) {
  return std::make_shared<scheduling::CircuitBreaker>(std::move(name), config.failure_threshold(),
                                                      std::chrono::milliseconds(config.reset_timeout_ms()));
}

std::vector<std::string> HpaWorkloads(const coordinator::runtime::config::RuntimeConfig& config) {
  std::vector<std::string> names;
  for (const auto& workload : config.predictive_scaling().workloads()) names.push_back(workload.name());
  for (const auto& workload : config.scaling_dependencies().workloads()) {
    if (std::find(names.begin(), names.end(), workload.name()) == names.end()) names.push_back(workload.name());
  }
  return names;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const coordinator::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and monitoring
  // ------------------------------------------------------------------
  app.store      = BuildStore(config);
  app.monitoring = std::make_shared<monitoring::MonitoringService>(config.observability(), app.store);

  // ------------------------------------------------------------------
  // Cluster clients
  // ------------------------------------------------------------------
  const auto& k8s       = config.kubernetes();
  const auto  ns        = k8s.namespace_().empty() ? std::string("default") : k8s.namespace_();
  auto        client    = std::make_shared<cluster::kube::KubeHttpClient>(cluster::kube::KubeClientOptions::FromConfig(k8s));
  auto        engine    = std::make_shared<cluster::kube::ArgoEngine>(client, ns);
  auto        node_api  = std::make_shared<cluster::kube::NodeMetricsClient>(client);
  auto        engine_cb = BuildBreaker("execution-engine", config.execution_engine().circuit_breaker());
  auto        hpa       = std::make_shared<cluster::GuardedAutoscaler>(std::make_shared<cluster::kube::HpaAutoscaler>(client, ns),
                                                                       BuildBreaker("autoscaler", config.execution_engine().circuit_breaker()));

  // ------------------------------------------------------------------
  // Scheduling
  // ------------------------------------------------------------------
  const auto& engine_cfg = config.execution_engine();
  app.poll_pool = std::make_shared<scheduling::WorkerPool>(
      "status-poll", engine_cfg.poll_workers() ? engine_cfg.poll_workers() : kDefaultPollWorkers);
  app.purge_pool = std::make_shared<scheduling::WorkerPool>(
      "cache-purge", config.cache().purge_workers() ? config.cache().purge_workers() : kDefaultPurgeWorkers);
  app.wheel = std::make_shared<scheduling::TimerWheel>(std::chrono::milliseconds(engine_cfg.timer_tick_ms()),
                                                       engine_cfg.timer_slots() ? engine_cfg.timer_slots() : kDefaultTimerSlots,
                                                       app.poll_pool);
  app.poll_pool->Start();
  app.purge_pool->Start();
  app.wheel->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto resources = std::make_shared<resources::ResourceManager>(config.resources(), node_api);
  auto quality   = std::make_shared<quality::QualityManager>(config.quality(), resources, app.store);
  auto cache     = std::make_shared<cache::CacheManager>(config.cache(), app.store, app.purge_pool);
  auto workflows = std::make_shared<workflow::WorkflowStore>(app.store);

  app.coordinator = std::make_shared<core::WorkflowCoordinator>(core::CoordinatorOptions::FromConfig(engine_cfg), quality, resources, cache,
                                                                app.monitoring, engine, engine_cb, workflows, app.wheel);
  app.coordinator->Hydrate();

  // ------------------------------------------------------------------
  // Scaling
  // ------------------------------------------------------------------
  const auto& features = config.features();

  if (features.scaling_dependencies()) {
    app.dependencies = std::make_shared<scaling::ScalingDependenciesService>(scaling::DependencyGraph::Build(config.scaling_dependencies()),
                                                                             config.scaling_dependencies(), hpa, app.monitoring, app.store);
  }

  if (features.predictive_scaling()) {
    std::weak_ptr<core::WorkflowCoordinator> weak = app.coordinator;
    app.predictive = std::make_shared<scaling::PredictiveScalingService>(
        config.predictive_scaling(), hpa, app.monitoring, app.store, [weak](const std::string& workflow_type) {
          auto coordinator = weak.lock();
          return coordinator ? static_cast<double>(coordinator->CountActive(workflow_type)) : 0.0;
        });
    if (app.dependencies) app.predictive->SetListener(app.dependencies);
    app.predictive->Start();
  }

  if (features.hpa_event_logging()) {
    app.hpa_logger =
        std::make_shared<scaling::HpaEventLogger>(config.hpa_event_logging(), HpaWorkloads(config), hpa, app.monitoring, app.store);
    app.hpa_logger->Start();
  }

  // ------------------------------------------------------------------
  // Admission queue
  // ------------------------------------------------------------------
  if (features.task_queue()) {
    const auto& queue_cfg = config.task_queue();
    app.task_pool = std::make_shared<scheduling::WorkerPool>("task-dispatch", queue_cfg.workers() ? queue_cfg.workers() : kDefaultTaskWorkers);
    app.task_pool->Start();
    app.tasks = std::make_shared<tasks::TaskQueueManager>(tasks::TaskQueueOptions::FromConfig(queue_cfg), app.coordinator, app.store,
                                                          app.task_pool);
    app.tasks->Hydrate();
    app.tasks->Start();
  }

  COORDINATOR_LOG_INFO("features", {observability::BoolField("predictive_scaling", features.predictive_scaling()),
                                    observability::BoolField("scaling_dependencies", features.scaling_dependencies()),
                                    observability::BoolField("hpa_event_logging", features.hpa_event_logging()),
                                    observability::BoolField("task_queue", features.task_queue())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator    = app.coordinator;
  ctx.cache          = cache;
  ctx.monitoring     = app.monitoring;
  ctx.resources      = resources;
  ctx.predictive     = app.predictive;
  ctx.engine_breaker = engine_cb;
  ctx.store          = app.store;
  ctx.tasks          = app.tasks;

  auto workflow_service = std::make_shared<service::WorkflowService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::WorkflowServer>(workflow_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

void Shutdown(Application& app) {
  if (app.tasks) app.tasks->Stop();
  if (app.task_pool) app.task_pool->Stop();

  if (app.predictive) app.predictive->Close();
  if (app.hpa_logger) app.hpa_logger->Stop();

  if (app.wheel) app.wheel->Stop();
  if (app.poll_pool) app.poll_pool->Stop();
  if (app.purge_pool) app.purge_pool->Stop();

  if (app.monitoring) app.monitoring->Stop();
}

} // namespace coordinator::factory
