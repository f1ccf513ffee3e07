#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/core/v1/task.pb.h"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/scheduling/retry_policy.hpp"

namespace coordinator::core {
class WorkflowCoordinator;
}
namespace coordinator::db {
class KvStore;
}
namespace coordinator::scheduling {
class PeriodicTask;
class WorkerPool;
}

namespace coordinator::tasks {

struct LaneOptions {
  uint32_t                  concurrency           = 1;
  uint32_t                  rate_limit_per_second = 0;
  uint32_t                  max_queued            = 0;
  std::chrono::milliseconds deadline{0};
  scheduling::RetryOptions  retry;

  static LaneOptions FromConfig(const coordinator::runtime::config::TaskLaneConfig& config, LaneOptions defaults);
};

struct TaskQueueOptions {
  std::chrono::milliseconds dispatch_interval{250};
  // indexed by TaskLane - 1: high, medium, low, batch
  std::array<LaneOptions, 4> lanes;
  uint32_t                   breaker_failure_threshold = 5;
  std::chrono::milliseconds  breaker_reset_timeout{60000};

  TaskQueueOptions();

  static TaskQueueOptions FromConfig(const coordinator::runtime::config::TaskQueueConfig& config);
};

// CRITICAL and HIGH share the high lane; BACKGROUND runs as batch.
coordinator::v1::TaskLane LaneFor(coordinator::v1::Priority priority);

/*
  Admission stage in front of WorkflowCoordinator::CreateWorkflow.

  Submit persists the request as an AdmissionTask and queues it on the
  lane of its priority. Each Dispatch pass walks the lanes from high to
  batch and starts as many attempts as the lane's concurrency and rate
  limit allow. An attempt runs CreateWorkflow:

    admitted             workflow created or served from cache
    failed               validation or quota rejection, or retries used up
    queued again         transient failure or submit error, after backoff

  A per-type circuit breaker holds a type's tasks in the queue while the
  type keeps failing; held tasks do not spend attempts. Tasks past their
  lane deadline expire instead of being dispatched.

  Only non-terminal tasks are kept in memory. Records live under
  "records:task:<id>"; Hydrate re-queues the ones a restart interrupted.
*/
class TaskQueueManager {
 public:
  using ClockFn = std::function<int64_t()>;

  TaskQueueManager(TaskQueueOptions options, std::shared_ptr<core::WorkflowCoordinator> coordinator, std::shared_ptr<db::KvStore> store,
                   std::shared_ptr<scheduling::WorkerPool> pool = nullptr, ClockFn clock = {},
                   scheduling::CircuitBreaker::ClockFn breaker_clock = {});
  ~TaskQueueManager();

  TaskQueueManager(const TaskQueueManager&)            = delete;
  TaskQueueManager& operator=(const TaskQueueManager&) = delete;

  // Starts the dispatch loop. Without it, Dispatch() is driven by the caller.
  void Start();
  void Stop();

  // Throws ValidationError for a malformed request, TransientInfraError when the lane is full or the record cannot be written.
  coordinator::v1::AdmissionTask Submit(const coordinator::v1::WorkflowRequest& request);

  coordinator::v1::AdmissionTask Get(const std::string& task_id) const;

  /*
    Queued tasks are cancelled outright. A task being dispatched is
    marked and its workflow, if one gets created, is cancelled when the
    attempt returns. An admitted task cancels its workflow.
    Throws NotFound for unknown ids and InvalidState for finished tasks.
  */
  coordinator::v1::AdmissionTask Cancel(const std::string& task_id);

  // One pass over the lanes. Returns the number of attempts started.
  std::size_t Dispatch();

  // Re-queues persisted tasks that were queued or in flight.
  std::size_t Hydrate();

  std::size_t Queued(coordinator::v1::TaskLane lane) const;
  std::size_t InFlight(coordinator::v1::TaskLane lane) const;

  static std::string Key(const std::string& task_id);

 private:
  enum class Outcome { kAdmitted, kRejected, kRetry };

  struct Lane {
    LaneOptions             options;
    std::deque<std::string> queue;
    uint32_t                in_flight        = 0;
    int64_t                 window_start_ms  = 0;
    uint32_t                started_in_window = 0;
  };

  Lane&                       LaneOf(coordinator::v1::TaskLane lane);
  const Lane&                 LaneOf(coordinator::v1::TaskLane lane) const;
  scheduling::CircuitBreaker& BreakerFor(const std::string& workflow_type);

  void Attempt(const std::string& task_id, const coordinator::v1::WorkflowRequest& request);
  void Complete(const std::string& task_id, Outcome outcome, const std::string& workflow_id, bool cache_hit, const std::string& message);
  void Finish(coordinator::v1::AdmissionTask& task, coordinator::v1::TaskPhase phase, const std::string& message);
  void Persist(const coordinator::v1::AdmissionTask& task);

  TaskQueueOptions                           options_;
  std::shared_ptr<core::WorkflowCoordinator> coordinator_;
  std::shared_ptr<db::KvStore>               store_;
  std::shared_ptr<scheduling::WorkerPool>    pool_;
  ClockFn                                    clock_;
  scheduling::CircuitBreaker::ClockFn        breaker_clock_;

  mutable std::mutex                                                 mutex_;
  std::array<Lane, 4>                                                lanes_;
  std::map<std::string, coordinator::v1::AdmissionTask>              tasks_;
  std::map<std::string, std::unique_ptr<scheduling::CircuitBreaker>> breakers_;

  std::unique_ptr<scheduling::PeriodicTask> loop_;
};

} // namespace coordinator::tasks
