#include "task_queue_manager.hpp"

#include <algorithm>
#include <utility>

#include "internal/core/workflow_coordinator.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resources/tier_policy.hpp"
#include "internal/scheduling/periodic_task.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace coordinator::tasks {

using namespace coordinator::v1;

namespace {

constexpr const char* kPrefix = "records:task:";

LaneOptions MakeLane(uint32_t concurrency, uint32_t rate, uint32_t max_attempts, int64_t backoff_ms) {
  LaneOptions lane;
  lane.concurrency           = concurrency;
  lane.rate_limit_per_second = rate;
  lane.retry.max_attempts    = max_attempts;
  lane.retry.initial_backoff = std::chrono::milliseconds(backoff_ms);
  lane.retry.max_backoff     = std::chrono::milliseconds(backoff_ms * 8);
  lane.retry.multiplier      = 2.0;
  return lane;
}

std::size_t Index(TaskLane lane) {
  switch (lane) {
    case TASK_LANE_HIGH:
      return 0;
    case TASK_LANE_MEDIUM:
      return 1;
    case TASK_LANE_LOW:
      return 2;
    default:
      return 3;
  }
}

constexpr std::array<TaskLane, 4> kLaneOrder = {TASK_LANE_HIGH, TASK_LANE_MEDIUM, TASK_LANE_LOW, TASK_LANE_BATCH};

bool IsFinished(TaskPhase phase) {
  return phase == TASK_PHASE_ADMITTED || phase == TASK_PHASE_FAILED || phase == TASK_PHASE_CANCELLED || phase == TASK_PHASE_EXPIRED;
}

} // namespace

LaneOptions LaneOptions::FromConfig(const coordinator::runtime::config::TaskLaneConfig& config, LaneOptions defaults) {
  LaneOptions lane = defaults;
  if (config.concurrency() > 0) lane.concurrency = config.concurrency();
  if (config.rate_limit_per_second() > 0) lane.rate_limit_per_second = config.rate_limit_per_second();
  if (config.max_queued() > 0) lane.max_queued = config.max_queued();
  if (config.deadline_ms() > 0) lane.deadline = std::chrono::milliseconds(config.deadline_ms());
  lane.retry = scheduling::RetryOptions::FromConfig(config.retry(), defaults.retry);
  return lane;
}

TaskQueueOptions::TaskQueueOptions()
    : lanes{MakeLane(50, 100, 3, 1000), MakeLane(30, 50, 3, 2000), MakeLane(20, 25, 2, 5000), MakeLane(10, 10, 1, 10000)} {
}

TaskQueueOptions TaskQueueOptions::FromConfig(const coordinator::runtime::config::TaskQueueConfig& config) {
  TaskQueueOptions options;
  if (config.dispatch_interval_ms() > 0) options.dispatch_interval = std::chrono::milliseconds(config.dispatch_interval_ms());
  options.lanes[0] = LaneOptions::FromConfig(config.high(), options.lanes[0]);
  options.lanes[1] = LaneOptions::FromConfig(config.medium(), options.lanes[1]);
  options.lanes[2] = LaneOptions::FromConfig(config.low(), options.lanes[2]);
  options.lanes[3] = LaneOptions::FromConfig(config.batch(), options.lanes[3]);
  if (config.circuit_breaker().failure_threshold() > 0) options.breaker_failure_threshold = config.circuit_breaker().failure_threshold();
  if (config.circuit_breaker().reset_timeout_ms() > 0) {
    options.breaker_reset_timeout = std::chrono::milliseconds(config.circuit_breaker().reset_timeout_ms());
  }
  return options;
}

TaskLane LaneFor(Priority priority) {
  switch (priority) {
    case PRIORITY_CRITICAL:
    case PRIORITY_HIGH:
      return TASK_LANE_HIGH;
    case PRIORITY_MEDIUM:
      return TASK_LANE_MEDIUM;
    case PRIORITY_LOW:
      return TASK_LANE_LOW;
    case PRIORITY_BACKGROUND:
      return TASK_LANE_BATCH;
    default:
      return TASK_LANE_MEDIUM;
  }
}

TaskQueueManager::TaskQueueManager(TaskQueueOptions options, std::shared_ptr<core::WorkflowCoordinator> coordinator,
                                   std::shared_ptr<db::KvStore> store, std::shared_ptr<scheduling::WorkerPool> pool, ClockFn clock,
                                   scheduling::CircuitBreaker::ClockFn breaker_clock)
    : options_(std::move(options)),
      coordinator_(std::move(coordinator)),
      store_(std::move(store)),
      pool_(std::move(pool)),
      clock_(std::move(clock)),
      breaker_clock_(std::move(breaker_clock)) {
  if (!clock_) {
    clock_ = [] { return util::NowMillis(); };
  }
  for (std::size_t i = 0; i < lanes_.size(); ++i) {
    lanes_[i].options = options_.lanes[i];
    if (lanes_[i].options.concurrency == 0) lanes_[i].options.concurrency = 1;
  }
}

TaskQueueManager::~TaskQueueManager() {
  Stop();
}

std::string TaskQueueManager::Key(const std::string& task_id) {
  return kPrefix + task_id;
}

void TaskQueueManager::Start() {
  if (loop_) return;
  loop_ = std::make_unique<scheduling::PeriodicTask>("task-dispatch", options_.dispatch_interval, [this] { Dispatch(); });
  loop_->Start();
  COORDINATOR_LOG_INFO("task queue started", {observability::IntField("dispatch_interval_ms", options_.dispatch_interval.count())});
}

void TaskQueueManager::Stop() {
  if (loop_) loop_->Stop();
}

TaskQueueManager::Lane& TaskQueueManager::LaneOf(TaskLane lane) {
  return lanes_[Index(lane)];
}

const TaskQueueManager::Lane& TaskQueueManager::LaneOf(TaskLane lane) const {
  return lanes_[Index(lane)];
}

scheduling::CircuitBreaker& TaskQueueManager::BreakerFor(const std::string& workflow_type) {
  auto& breaker = breakers_[workflow_type];
  if (!breaker) {
    breaker = std::make_unique<scheduling::CircuitBreaker>("task-type:" + workflow_type, options_.breaker_failure_threshold,
                                                           options_.breaker_reset_timeout, breaker_clock_);
  }
  return *breaker;
}

void TaskQueueManager::Persist(const AdmissionTask& task) {
  const auto res = store_->Set(Key(task.id()), task.SerializeAsString());
  if (!res) {
    throw util::TransientInfraError("persist task " + task.id() + ": " + res.message);
  }
}

// ------------------------------------------------------------
// Intake
// ------------------------------------------------------------

AdmissionTask TaskQueueManager::Submit(const WorkflowRequest& input) {
  core::WorkflowCoordinator::ValidateRequest(input);

  WorkflowRequest request = input;
  if (request.priority() == PRIORITY_UNSPECIFIED) {
    request.set_priority(resources::DefaultPriority(request));
  }

  const auto now = clock_();

  AdmissionTask task;
  task.set_id("task-" + util::ToString(util::GenerateUUID()));
  *task.mutable_request() = request;
  task.set_lane(LaneFor(request.priority()));
  task.set_phase(TASK_PHASE_QUEUED);
  task.set_created_at_ms(now);
  task.set_next_attempt_at_ms(now);

  std::lock_guard lock(mutex_);
  auto&           lane = LaneOf(task.lane());
  if (lane.options.deadline.count() > 0) task.set_deadline_ms(now + lane.options.deadline.count());

  if (lane.options.max_queued > 0 && lane.queue.size() >= lane.options.max_queued) {
    throw util::TransientInfraError(std::string("task lane ") + std::string(model::ToString(task.lane())) + " is full");
  }

  Persist(task);
  tasks_.emplace(task.id(), task);
  lane.queue.push_back(task.id());

  COORDINATOR_LOG_INFO("task queued", {observability::StringField("task_id", task.id()), observability::StringField("type", request.type()),
                                       observability::StringField("lane", model::ToString(task.lane())),
                                       observability::IntField("queued", lane.queue.size())});
  return task;
}

AdmissionTask TaskQueueManager::Get(const std::string& task_id) const {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it != tasks_.end()) return it->second;
  }

  const auto raw = store_->Get(Key(task_id));
  if (!raw) throw util::NotFound("task " + task_id + " not found");

  AdmissionTask task;
  if (!task.ParseFromString(*raw)) {
    COORDINATOR_LOG_WARN("unreadable task record", {observability::StringField("task_id", task_id)});
    throw util::NotFound("task " + task_id + " not found");
  }
  return task;
}

AdmissionTask TaskQueueManager::Cancel(const std::string& task_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it != tasks_.end()) {
      auto& task = it->second;
      if (task.phase() == TASK_PHASE_DISPATCHING) {
        task.set_cancel_requested(true);
        Persist(task);
        COORDINATOR_LOG_INFO("task cancel requested during dispatch", {observability::StringField("task_id", task_id)});
        return task;
      }
      AdmissionTask snapshot = task;
      Finish(snapshot, TASK_PHASE_CANCELLED, "cancelled while queued");
      tasks_.erase(it);
      return snapshot;
    }
  }

  auto task = Get(task_id);
  if (task.phase() != TASK_PHASE_ADMITTED) {
    throw util::InvalidState("task " + task_id + " is already " + std::string(model::ToString(task.phase())));
  }
  const auto workflow_id = task.workflow_id();

  // the task is done with the queue; only its workflow is still running
  coordinator_->CancelWorkflow(workflow_id);
  Finish(task, TASK_PHASE_CANCELLED, "workflow " + workflow_id + " cancelled");
  return task;
}

std::size_t TaskQueueManager::Queued(TaskLane lane) const {
  std::lock_guard lock(mutex_);
  const auto&     queue = LaneOf(lane).queue;
  return static_cast<std::size_t>(std::count_if(queue.begin(), queue.end(), [&](const std::string& id) {
    auto it = tasks_.find(id);
    return it != tasks_.end() && it->second.phase() == TASK_PHASE_QUEUED;
  }));
}

std::size_t TaskQueueManager::InFlight(TaskLane lane) const {
  std::lock_guard lock(mutex_);
  return LaneOf(lane).in_flight;
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

std::size_t TaskQueueManager::Dispatch() {
  std::vector<std::pair<std::string, WorkflowRequest>> ready;

  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_();

    for (const auto lane_id : kLaneOrder) {
      auto& lane = LaneOf(lane_id);
      if (lane.options.rate_limit_per_second > 0 && now - lane.window_start_ms >= 1000) {
        lane.window_start_ms   = now;
        lane.started_in_window = 0;
      }

      std::deque<std::string> keep;
      while (!lane.queue.empty()) {
        auto id = std::move(lane.queue.front());
        lane.queue.pop_front();

        auto it = tasks_.find(id);
        // cancelled or finished while waiting
        if (it == tasks_.end() || it->second.phase() != TASK_PHASE_QUEUED) continue;
        auto& task = it->second;

        if (task.deadline_ms() > 0 && now >= task.deadline_ms()) {
          Finish(task, TASK_PHASE_EXPIRED, "not admitted before its deadline");
          tasks_.erase(it);
          continue;
        }

        const bool has_slot = lane.in_flight < lane.options.concurrency &&
                              (lane.options.rate_limit_per_second == 0 || lane.started_in_window < lane.options.rate_limit_per_second);
        if (!has_slot || task.next_attempt_at_ms() > now || !BreakerFor(task.request().type()).Allow()) {
          keep.push_back(std::move(id));
          continue;
        }

        task.set_phase(TASK_PHASE_DISPATCHING);
        task.set_attempts(task.attempts() + 1);
        ++lane.in_flight;
        ++lane.started_in_window;
        ready.emplace_back(task.id(), task.request());
      }
      lane.queue = std::move(keep);
    }
  }

  for (auto& [id, request] : ready) {
    if (pool_) {
      const bool queued = pool_->Submit([this, id = id, request = request] { Attempt(id, request); });
      if (queued) continue;
      COORDINATOR_LOG_WARN("dispatch pool saturated, running attempt inline", {observability::StringField("task_id", id)});
    }
    Attempt(id, request);
  }
  return ready.size();
}

void TaskQueueManager::Attempt(const std::string& task_id, const WorkflowRequest& request) {
  try {
    auto result = coordinator_->CreateWorkflow(request);
    if (!result.cache_hit && result.status.status() == WORKFLOW_PHASE_ERROR) {
      Complete(task_id, Outcome::kRetry, result.workflow_id, false, result.status.message());
      return;
    }
    Complete(task_id, Outcome::kAdmitted, result.workflow_id, result.cache_hit, {});
  } catch (const util::TransientInfraError& e) {
    Complete(task_id, Outcome::kRetry, {}, false, e.what());
  } catch (const std::exception& e) {
    // validation, quota and engine rejections do not improve with retries
    Complete(task_id, Outcome::kRejected, {}, false, e.what());
  }
}

void TaskQueueManager::Complete(const std::string& task_id, Outcome outcome, const std::string& workflow_id, bool cache_hit,
                                const std::string& message) {
  bool cancel_workflow = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it == tasks_.end()) return;
    auto& task = it->second;
    auto& lane = LaneOf(task.lane());
    if (lane.in_flight > 0) --lane.in_flight;

    auto& breaker = BreakerFor(task.request().type());
    if (outcome == Outcome::kRetry) {
      breaker.RecordFailure();
    } else {
      breaker.RecordSuccess();
    }

    switch (outcome) {
      case Outcome::kAdmitted:
        task.set_workflow_id(workflow_id);
        task.set_cache_hit(cache_hit);
        if (task.cancel_requested()) {
          cancel_workflow = true;
          break;
        }
        Finish(task, TASK_PHASE_ADMITTED, cache_hit ? "served from cache" : "workflow created");
        break;
      case Outcome::kRejected:
        Finish(task, TASK_PHASE_FAILED, message);
        break;
      case Outcome::kRetry: {
        const auto max_attempts = lane.options.retry.max_attempts == 0 ? 1 : lane.options.retry.max_attempts;
        if (task.cancel_requested()) {
          Finish(task, TASK_PHASE_CANCELLED, "cancelled during dispatch");
          break;
        }
        if (task.attempts() >= max_attempts) {
          Finish(task, TASK_PHASE_FAILED, "gave up after " + std::to_string(task.attempts()) + " attempt(s): " + message);
          break;
        }
        const auto delay = scheduling::BackoffDelay(lane.options.retry, task.attempts());
        task.set_phase(TASK_PHASE_QUEUED);
        task.set_message(message);
        task.set_next_attempt_at_ms(clock_() + delay.count());
        lane.queue.push_back(task.id());
        COORDINATOR_LOG_WARN("task attempt failed, requeued",
                             {observability::StringField("task_id", task.id()), observability::IntField("attempt", task.attempts()),
                              observability::IntField("backoff_ms", delay.count()), observability::StringField("error", message)});
        try {
          Persist(task);
        } catch (const util::TransientInfraError& e) {
          COORDINATOR_LOG_WARN("failed to persist requeued task", {observability::StringField("task_id", task.id()), observability::StringField("error", e.what())});
        }
        return;
      }
    }

    if (!cancel_workflow) {
      tasks_.erase(it);
      return;
    }
  }

  // CancelWorkflow takes the workflow's own lock; never call it under mutex_
  try {
    coordinator_->CancelWorkflow(workflow_id);
  } catch (const std::exception& e) {
    COORDINATOR_LOG_ERROR("failed to cancel workflow of cancelled task",
                          {observability::StringField("task_id", task_id), observability::StringField("workflow_id", workflow_id),
                           observability::StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(task_id);
  if (it == tasks_.end()) return;
  Finish(it->second, TASK_PHASE_CANCELLED, "workflow " + workflow_id + " cancelled");
  tasks_.erase(it);
}

void TaskQueueManager::Finish(AdmissionTask& task, TaskPhase phase, const std::string& message) {
  task.set_phase(phase);
  task.set_message(message);
  task.set_finished_at_ms(clock_());

  COORDINATOR_LOG_INFO("task finished", {observability::StringField("task_id", task.id()), observability::StringField("phase", model::ToString(phase)),
                                         observability::StringField("workflow_id", task.workflow_id()),
                                         observability::IntField("attempts", task.attempts()), observability::StringField("message", message)});
  try {
    Persist(task);
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_ERROR("failed to persist finished task", {observability::StringField("task_id", task.id()), observability::StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Restart
// ------------------------------------------------------------

std::size_t TaskQueueManager::Hydrate() {
  std::size_t restored = 0;

  std::lock_guard lock(mutex_);
  for (const auto& key : store_->ListKeys(kPrefix)) {
    const auto raw = store_->Get(key);
    if (!raw) continue;

    AdmissionTask task;
    if (!task.ParseFromString(*raw)) {
      COORDINATOR_LOG_WARN("skipping unreadable task record", {observability::StringField("key", key)});
      continue;
    }
    if (IsFinished(task.phase()) || tasks_.count(task.id()) > 0) continue;

    // an attempt cut short by the restart may have created its workflow; the cache claim absorbs the repeat
    if (task.phase() == TASK_PHASE_DISPATCHING && task.cancel_requested()) {
      Finish(task, TASK_PHASE_CANCELLED, "cancelled during dispatch");
      continue;
    }
    task.set_phase(TASK_PHASE_QUEUED);
    LaneOf(task.lane()).queue.push_back(task.id());
    tasks_.emplace(task.id(), std::move(task));
    ++restored;
  }

  // oldest first within each lane
  const auto created_at = [&](const std::string& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? int64_t{0} : it->second.created_at_ms();
  };
  for (auto& lane : lanes_) {
    std::stable_sort(lane.queue.begin(), lane.queue.end(), [&](const std::string& a, const std::string& b) { return created_at(a) < created_at(b); });
  }

  if (restored > 0) COORDINATOR_LOG_INFO("task queue restored", {observability::IntField("tasks", restored)});
  return restored;
}

} // namespace coordinator::tasks
