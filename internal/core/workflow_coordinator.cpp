#include "workflow_coordinator.hpp"

#include <algorithm>
#include <cctype>

#include "internal/cache/cache_manager.hpp"
#include "internal/cluster/execution_engine.hpp"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/quality/quality_manager.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/resources/tier_policy.hpp"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/workflow/status_poller.hpp"
#include "internal/workflow/status_reconciler.hpp"
#include "internal/workflow/workflow_store.hpp"

namespace coordinator::core {

using namespace coordinator::v1;

namespace {

constexpr std::size_t kMaxTypeLength = 63;

bool IsNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

} // namespace

CoordinatorOptions CoordinatorOptions::FromConfig(const coordinator::runtime::config::ExecutionEngineConfig& config) {
  CoordinatorOptions options;
  options.entrypoint      = config.entrypoint().empty() ? "main" : config.entrypoint();
  options.service_account = config.service_account();
  options.submit_retry    = scheduling::RetryOptions::FromConfig(config.submit_retry());
  if (config.poll_interval_ms() > 0) options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms());
  return options;
}

WorkflowCoordinator::WorkflowCoordinator(CoordinatorOptions options, std::shared_ptr<quality::QualityManager> quality,
                                         std::shared_ptr<resources::ResourceManager> resources, std::shared_ptr<cache::CacheManager> cache,
                                         std::shared_ptr<monitoring::MonitoringService> monitoring,
                                         std::shared_ptr<cluster::ExecutionEngine> engine, std::shared_ptr<scheduling::CircuitBreaker> breaker,
                                         std::shared_ptr<workflow::WorkflowStore> workflows, std::shared_ptr<scheduling::TimerWheel> wheel,
                                         scheduling::RetryPolicy::Sleeper sleeper)
    : options_(std::move(options)),
      retry_(options_.submit_retry, std::move(sleeper)),
      quality_(std::move(quality)),
      resources_(std::move(resources)),
      cache_(std::move(cache)),
      monitoring_(std::move(monitoring)),
      engine_(std::move(engine)),
      breaker_(std::move(breaker)),
      workflows_(std::move(workflows)) {
  poller_ = std::make_unique<workflow::StatusPoller>(std::move(wheel), options_.poll_interval,
                                                     [this](const std::string& id) { return Reconcile(id); });
}

WorkflowCoordinator::~WorkflowCoordinator() = default;

void WorkflowCoordinator::ValidateRequest(const WorkflowRequest& request) {
  const auto& type = request.type();
  if (type.empty()) {
    throw util::ValidationError("create workflow: type is required");
  }
  if (type.size() > kMaxTypeLength || !std::all_of(type.begin(), type.end(), IsNameChar) || type.front() == '-' || type.back() == '-') {
    throw util::ValidationError("create workflow: type '" + type + "' must be lowercase alphanumerics and '-', at most 63 characters");
  }
  if (request.user_id().empty()) {
    throw util::ValidationError("create workflow: user_id is required");
  }
  for (const auto& [key, value] : request.parameters()) {
    if (key.empty()) {
      throw util::ValidationError("create workflow: parameter names must not be empty");
    }
  }
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

CreateWorkflowResult WorkflowCoordinator::CreateWorkflow(const WorkflowRequest& input) {
  const auto started = std::chrono::steady_clock::now();

  ValidateRequest(input);

  WorkflowRequest request = input;
  if (request.priority() == PRIORITY_UNSPECIFIED) {
    request.set_priority(resources::DefaultPriority(request));
  }

  const auto assessment = quality_->AssessQuality(request);
  if (request.strict_quality() && assessment.clamped && request.quality_target() != QUALITY_TARGET_AUTO) {
    throw util::QuotaError("create workflow: quality " + std::string(model::ToString(assessment.requested)) + " not permitted for tier " +
                               std::string(model::ToString(request.subscription_tier())),
                           std::string(model::ToString(assessment.level)));
  }

  auto allocation = resources_->AllocateResources(assessment.level, request.priority(), request.subscription_tier());
  resources_->ValidateAllocation(allocation, request.subscription_tier());

  const bool  cacheable   = !request.has_enable_caching() || request.enable_caching();
  const auto  workflow_id = util::GenerateWorkflowId(request.type());
  std::string cache_key;

  if (cacheable) {
    cache_key  = cache::CacheManager::GenerateCacheKey(request, assessment.level);
    auto claim = cache_->Claim(cache_key, workflow_id);
    if (!claim.claimed) {
      monitoring_->RecordCacheResult(request.type(), true);
      COORDINATOR_LOG_INFO("cache hit, returning existing workflow",
                           {observability::StringField("workflow_id", claim.workflow_id), observability::StringField("cache_key", cache_key),
                            observability::BoolField("completed", claim.completed)});
      return CacheHit(request, assessment.level, claim.workflow_id, claim.completed);
    }
    monitoring_->RecordCacheResult(request.type(), false);
  }

  monitoring_->RecordQualityLevel(request.type(), assessment.level);
  monitoring_->RecordResourceAllocation(allocation);

  WorkflowRecord record;
  *record.mutable_request() = request;
  record.set_cache_key(cache_key);
  record.set_cacheable(cacheable);

  auto& status = *record.mutable_status();
  status.set_id(workflow_id);
  status.set_type(request.type());
  status.set_user_id(request.user_id());
  status.set_quality_level(assessment.level);
  status.set_status(WORKFLOW_PHASE_PENDING);
  *status.mutable_created_at() = util::ToProto(util::Now());
  *status.mutable_allocation() = allocation;
  for (const auto& factor : assessment.FactorScores(quality_->Weights())) {
    *status.add_quality_factors() = factor;
  }

  auto workflow_lock = workflows_->WorkflowMutex(workflow_id);
  std::lock_guard guard(*workflow_lock);

  try {
    workflows_->Put(record);
  } catch (const std::exception&) {
    if (cacheable) cache_->Release(cache_key, workflow_id);
    throw;
  }
  quality_->RecordQualitySelection(request.type(), assessment.level);

  cluster::JobTemplate job;
  job.name            = workflow_id;
  job.workflow_type   = request.type();
  job.entrypoint      = options_.entrypoint;
  job.service_account = options_.service_account;
  job.allocation      = allocation;
  job.labels          = {{"coordinator/workflow-type", request.type()},
                         {"coordinator/quality-level", std::string(model::ToString(assessment.level))},
                         {"coordinator/tier", std::string(model::ToString(request.subscription_tier()))}};
  job.arguments.insert(request.parameters().begin(), request.parameters().end());

  uint32_t attempts = 0;
  try {
    retry_.Execute("submit workflow", [&] { breaker_->Call([&] { engine_->Submit(job); }); }, &attempts);
  } catch (const util::TransientInfraError& e) {
    return {workflow_id, SubmitFailed(record, attempts, e.what()), false};
  } catch (const util::ValidationError& e) {
    SubmitFailed(record, attempts, e.what());
    throw;
  }

  // the job exists in the engine now; it is polled even if the attempt count cannot be saved
  poller_->Track(workflow_id);
  record.set_submit_attempts(attempts);
  try {
    workflows_->Put(record);
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_WARN("failed to persist submit attempts",
                         {observability::StringField("workflow_id", workflow_id), observability::StringField("error", e.what())});
  }

  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
  monitoring_->RecordWorkflowCreation(request.type(), elapsed);

  COORDINATOR_LOG_INFO("workflow created",
                       {observability::StringField("workflow_id", workflow_id), observability::StringField("type", request.type()),
                        observability::StringField("user_id", request.user_id()), observability::StringField("quality", model::ToString(assessment.level)),
                        observability::StringField("priority", model::ToString(request.priority())),
                        observability::StringField("node_pool", model::ToString(allocation.node_pool())),
                        observability::IntField("attempts", attempts)});

  return {workflow_id, record.status(), false};
}

WorkflowStatus WorkflowCoordinator::SubmitFailed(WorkflowRecord& record, uint32_t attempts, const std::string& cause) {
  auto& status = *record.mutable_status();
  status.set_status(WORKFLOW_PHASE_ERROR);
  status.set_message("submit failed after " + std::to_string(attempts) + " attempt(s): " + cause);
  *status.mutable_finished_at() = util::ToProto(util::Now());
  record.set_submit_attempts(attempts);

  COORDINATOR_LOG_ERROR("workflow submission failed",
                        {observability::StringField("workflow_id", status.id()), observability::StringField("type", status.type()),
                         observability::IntField("attempts", attempts), observability::StringField("error", cause)});

  if (record.cacheable()) cache_->Release(record.cache_key(), status.id());
  monitoring_->RecordWorkflowError(status.type(), cause);

  try {
    workflows_->Put(record);
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_ERROR("failed to persist submit failure", {observability::StringField("workflow_id", status.id()), observability::StringField("error", e.what())});
  }
  return status;
}

CreateWorkflowResult WorkflowCoordinator::CacheHit(const WorkflowRequest& request, QualityLevel level, const std::string& workflow_id,
                                                   bool completed) {
  // the producer may belong to another user; only its progress is shared
  WorkflowStatus status;
  status.set_id(workflow_id);
  status.set_type(request.type());
  status.set_user_id(request.user_id());
  status.set_quality_level(level);
  status.set_cache_hit(true);

  if (auto existing = workflows_->Get(workflow_id)) {
    const auto& producer = existing->status();
    status.set_status(producer.status());
    status.set_progress(producer.progress());
    *status.mutable_created_at() = producer.created_at();
    if (producer.has_started_at()) *status.mutable_started_at() = producer.started_at();
    if (producer.has_finished_at()) *status.mutable_finished_at() = producer.finished_at();
    if (producer.has_estimated_completion()) *status.mutable_estimated_completion() = producer.estimated_completion();
    status.set_duration_seconds(producer.duration_seconds());
  } else {
    // the producing record is gone; the cached result still stands
    status.set_status(completed ? WORKFLOW_PHASE_SUCCEEDED : WORKFLOW_PHASE_PENDING);
    if (completed) status.set_progress(100);
  }
  return {workflow_id, status, true};
}

// ------------------------------------------------------------
// Read / cancel
// ------------------------------------------------------------

WorkflowStatus WorkflowCoordinator::GetWorkflow(const std::string& workflow_id) {
  auto record = workflows_->Get(workflow_id);
  if (!record) throw util::NotFound("get workflow: workflow " + workflow_id + " not found");

  if (model::IsTerminal(record->status().status())) return record->status();

  if (breaker_->CurrentState() == scheduling::CircuitBreaker::State::kOpen) {
    COORDINATOR_LOG_DEBUG("engine circuit open, serving stored status", {observability::StringField("workflow_id", workflow_id)});
    return record->status();
  }

  try {
    Reconcile(workflow_id);
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_WARN("reconcile failed, serving stored status",
                         {observability::StringField("workflow_id", workflow_id), observability::StringField("error", e.what())});
  }

  record = workflows_->Get(workflow_id);
  if (!record) throw util::NotFound("get workflow: workflow " + workflow_id + " not found");
  return record->status();
}

WorkflowStatus WorkflowCoordinator::CancelWorkflow(const std::string& workflow_id) {
  if (!workflows_->Exists(workflow_id)) throw util::NotFound("cancel workflow: workflow " + workflow_id + " not found");

  auto workflow_lock = workflows_->WorkflowMutex(workflow_id);
  std::lock_guard guard(*workflow_lock);

  auto record = workflows_->Get(workflow_id);
  if (!record) throw util::NotFound("cancel workflow: workflow " + workflow_id + " not found");

  auto& status = *record->mutable_status();
  if (model::IsTerminal(status.status())) {
    throw util::InvalidState("cancel workflow: workflow " + workflow_id + " already " + std::string(model::ToString(status.status())));
  }

  try {
    retry_.Execute("terminate workflow", [&] { breaker_->Call([&] { engine_->Terminate(workflow_id); }); });
  } catch (const util::NotFound&) {
    COORDINATOR_LOG_WARN("workflow unknown to the engine, cancelling locally", {observability::StringField("workflow_id", workflow_id)});
  }

  status.set_status(WORKFLOW_PHASE_FAILED);
  status.set_message("cancelled");
  *status.mutable_finished_at() = util::ToProto(util::Now());
  status.clear_estimated_completion();
  if (util::IsSet(status.created_at())) {
    status.set_duration_seconds(std::chrono::duration<double>(util::FromProto(status.finished_at()) - util::FromProto(status.created_at())).count());
  }
  workflows_->Put(*record);

  poller_->Untrack(workflow_id);
  if (record->cacheable()) cache_->Release(record->cache_key(), workflow_id);
  monitoring_->RecordWorkflowCancellation(status.type());

  COORDINATOR_LOG_INFO("workflow cancelled", {observability::StringField("workflow_id", workflow_id), observability::StringField("type", status.type())});
  return status;
}

std::vector<WorkflowStatus> WorkflowCoordinator::ListActiveWorkflows(const std::string& user_id) {
  std::vector<WorkflowStatus> out;
  for (const auto& record : workflows_->ListActive()) {
    const auto& status = record.status();
    if (!user_id.empty() && status.user_id() != user_id) continue;
    out.push_back(status);
  }
  std::sort(out.begin(), out.end(), [](const WorkflowStatus& a, const WorkflowStatus& b) {
    return util::FromProto(a.created_at()) < util::FromProto(b.created_at());
  });
  return out;
}

std::size_t WorkflowCoordinator::CountActive(const std::string& workflow_type) const {
  return workflows_->CountActive(workflow_type);
}

bool WorkflowCoordinator::Polling(const std::string& workflow_id) const {
  return poller_->Tracking(workflow_id);
}

// ------------------------------------------------------------
// Reconciliation
// ------------------------------------------------------------

bool WorkflowCoordinator::Reconcile(const std::string& workflow_id) {
  observability::LogContext log_context({observability::StringField("workflow_id", workflow_id)});
  observability::SpanScope  span("workflow.reconcile");
  span.SetAttribute("workflow.id", std::string_view(workflow_id));

  auto workflow_lock = workflows_->WorkflowMutex(workflow_id);
  std::lock_guard guard(*workflow_lock);

  auto record = workflows_->Get(workflow_id);
  if (!record) return false;
  if (model::IsTerminal(record->status().status())) return false;

  cluster::EngineWorkflowStatus engine;
  try {
    engine = breaker_->Call([&] { return engine_->Poll(workflow_id); });
  } catch (const util::NotFound&) {
    span.RecordException("missing from execution engine");
    engine.phase   = WORKFLOW_PHASE_ERROR;
    engine.message = "workflow no longer exists in the execution engine";
  }

  auto& status = *record->mutable_status();
  if (!workflow::Reconcile(status, engine, util::Now())) return true;

  workflows_->Put(*record);

  if (model::IsTerminal(status.status())) {
    OnTerminal(*record, engine);
    return false;
  }
  return true;
}

void WorkflowCoordinator::OnTerminal(const WorkflowRecord& record, const cluster::EngineWorkflowStatus& engine) {
  const auto& status  = record.status();
  const bool  success = status.status() == WORKFLOW_PHASE_SUCCEEDED;

  monitoring_->RecordWorkflowCompletion(status.type(), success, std::chrono::duration<double>(status.duration_seconds()));

  // stage histograms are fed from the metrics record
  WorkflowMetrics metrics;
  metrics.set_workflow_id(status.id());
  metrics.set_type(status.type());
  for (const auto& [stage, seconds] : workflow::StageDurations(status)) {
    (*metrics.mutable_stage_durations_seconds())[stage] = seconds;
  }
  *metrics.mutable_utilization() = resources_->GetResourceUtilization();
  metrics.set_error_count(success ? 0 : 1);
  metrics.set_cache_hit_ratio(status.cache_hit() ? 1.0 : 0.0);
  metrics.set_recorded_at_ms(util::NowMillis());
  monitoring_->RecordWorkflowMetrics(metrics);

  if (record.cacheable()) {
    if (success) {
      cache_->Complete(record.cache_key(), status.id(), engine.outputs);
    } else {
      cache_->Release(record.cache_key(), status.id());
    }
  }
  if (!success) {
    monitoring_->RecordWorkflowError(status.type(), status.message());
  }

  COORDINATOR_LOG_INFO("workflow finished",
                       {observability::StringField("type", status.type()), observability::StringField("status", model::ToString(status.status())),
                        observability::DoubleField("duration_seconds", status.duration_seconds()),
                        observability::StringField("message", status.message())});
}

void WorkflowCoordinator::Hydrate() {
  for (const auto& record : workflows_->Hydrate()) {
    poller_->Track(record.status().id());
  }
}

} // namespace coordinator::core
