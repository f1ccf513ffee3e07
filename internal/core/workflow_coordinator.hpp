#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/core/v1/workflow.pb.h"
#include "internal/scheduling/retry_policy.hpp"

namespace coordinator::cache {
class CacheManager;
}
namespace coordinator::cluster {
class ExecutionEngine;
struct EngineWorkflowStatus;
}
namespace coordinator::monitoring {
class MonitoringService;
}
namespace coordinator::quality {
class QualityManager;
}
namespace coordinator::resources {
class ResourceManager;
}
namespace coordinator::scheduling {
class CircuitBreaker;
class TimerWheel;
}
namespace coordinator::workflow {
class StatusPoller;
class WorkflowStore;
}

namespace coordinator::core {

struct CreateWorkflowResult {
  std::string                     workflow_id;
  coordinator::v1::WorkflowStatus status;
  bool                            cache_hit = false;
};

struct CoordinatorOptions {
  std::string               entrypoint;
  std::string               service_account;
  scheduling::RetryOptions  submit_retry;
  std::chrono::milliseconds poll_interval{5000};

  static CoordinatorOptions FromConfig(const coordinator::runtime::config::ExecutionEngineConfig& config);
};

/*
  Glue between intake and the execution engine.

  CreateWorkflow runs the admission pipeline (validate, prioritize,
  assess quality, allocate, check the cache, persist, submit) and hands
  the workflow to the poller. Status is only ever changed by
  reconciliation against the engine or by cancellation, both under the
  workflow's own mutex.
*/
class WorkflowCoordinator {
 public:
  WorkflowCoordinator(CoordinatorOptions options, std::shared_ptr<quality::QualityManager> quality,
                      std::shared_ptr<resources::ResourceManager> resources, std::shared_ptr<cache::CacheManager> cache,
                      std::shared_ptr<monitoring::MonitoringService> monitoring, std::shared_ptr<cluster::ExecutionEngine> engine,
                      std::shared_ptr<scheduling::CircuitBreaker> breaker, std::shared_ptr<workflow::WorkflowStore> workflows,
                      std::shared_ptr<scheduling::TimerWheel> wheel, scheduling::RetryPolicy::Sleeper sleeper = {});
  ~WorkflowCoordinator();

  CreateWorkflowResult CreateWorkflow(const coordinator::v1::WorkflowRequest& request);

  coordinator::v1::WorkflowStatus GetWorkflow(const std::string& workflow_id);

  coordinator::v1::WorkflowStatus CancelWorkflow(const std::string& workflow_id);

  // Empty user_id lists every user's workflows.
  std::vector<coordinator::v1::WorkflowStatus> ListActiveWorkflows(const std::string& user_id);

  // Pulls engine state for one workflow. Returns true while it still needs polling.
  bool Reconcile(const std::string& workflow_id);

  // Re-tracks workflows that were in flight before a restart.
  void Hydrate();

  // Non-terminal workflows of one type; the predictive scaler's load signal.
  std::size_t CountActive(const std::string& workflow_type) const;

  bool Polling(const std::string& workflow_id) const;

  static void ValidateRequest(const coordinator::v1::WorkflowRequest& request);

 private:
  coordinator::v1::WorkflowStatus SubmitFailed(coordinator::v1::WorkflowRecord& record, uint32_t attempts, const std::string& cause);
  CreateWorkflowResult            CacheHit(const coordinator::v1::WorkflowRequest& request, coordinator::v1::QualityLevel level,
                                           const std::string& workflow_id, bool completed);
  void                            OnTerminal(const coordinator::v1::WorkflowRecord& record, const cluster::EngineWorkflowStatus& engine);

  CoordinatorOptions                             options_;
  scheduling::RetryPolicy                        retry_;
  std::shared_ptr<quality::QualityManager>       quality_;
  std::shared_ptr<resources::ResourceManager>    resources_;
  std::shared_ptr<cache::CacheManager>           cache_;
  std::shared_ptr<monitoring::MonitoringService> monitoring_;
  std::shared_ptr<cluster::ExecutionEngine>      engine_;
  std::shared_ptr<scheduling::CircuitBreaker>    breaker_;
  std::shared_ptr<workflow::WorkflowStore>       workflows_;
  std::unique_ptr<workflow::StatusPoller>        poller_;
};

} // namespace coordinator::core
