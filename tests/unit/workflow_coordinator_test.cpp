#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/cache_manager.hpp"
#include "internal/core/workflow_coordinator.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/quality/quality_manager.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/scheduling/timer_wheel.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/workflow_store.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace coordinator::v1;
using coordinator::core::WorkflowCoordinator;

struct Harness {
  std::shared_ptr<coordinator::db::memory::MemoryStore>      store      = std::make_shared<coordinator::db::memory::MemoryStore>();
  std::shared_ptr<coordinator::testing::FakeEngine>          engine     = std::make_shared<coordinator::testing::FakeEngine>();
  std::shared_ptr<coordinator::testing::FakeCluster>         cluster    = std::make_shared<coordinator::testing::FakeCluster>();
  std::shared_ptr<coordinator::scheduling::WorkerPool>       pool       = std::make_shared<coordinator::scheduling::WorkerPool>("test", 1, 64);
  std::shared_ptr<coordinator::scheduling::TimerWheel>       wheel      = std::make_shared<coordinator::scheduling::TimerWheel>(std::chrono::milliseconds(10), 64, pool);
  std::shared_ptr<coordinator::monitoring::MonitoringService> monitoring =
      std::make_shared<coordinator::monitoring::MonitoringService>(coordinator::runtime::config::ObservabilityConfig{}, store);
  std::shared_ptr<coordinator::scheduling::CircuitBreaker>   breaker =
      std::make_shared<coordinator::scheduling::CircuitBreaker>("execution-engine", 5, std::chrono::seconds(30));
  std::shared_ptr<coordinator::resources::ResourceManager>   resources;
  std::shared_ptr<coordinator::quality::QualityManager>      quality;
  std::shared_ptr<coordinator::cache::CacheManager>          cache;
  std::shared_ptr<coordinator::workflow::WorkflowStore>      workflows;
  coordinator::testing::RecordingSleeper                     sleeper;
  std::unique_ptr<WorkflowCoordinator>                       coordinator;

  explicit Harness(std::shared_ptr<coordinator::db::KvStore> records = nullptr) {
    workflows = std::make_shared<coordinator::workflow::WorkflowStore>(records ? records : store);
    pool->Start();
    cluster->SetUsage(0.1, 0.1);
    resources = std::make_shared<coordinator::resources::ResourceManager>(coordinator::runtime::config::ResourcesConfig{}, cluster);
    quality   = std::make_shared<coordinator::quality::QualityManager>(coordinator::runtime::config::QualityConfig{}, resources, store);
    cache     = std::make_shared<coordinator::cache::CacheManager>(coordinator::runtime::config::CacheConfig{}, store, pool);

    coordinator::runtime::config::ExecutionEngineConfig config;
    config.set_service_account("workflow-runner");
    config.mutable_submit_retry()->set_max_attempts(3);
    config.mutable_submit_retry()->set_initial_backoff_ms(100);

    // the wheel is never started; tests drive reconciliation by hand
    coordinator = std::make_unique<WorkflowCoordinator>(coordinator::core::CoordinatorOptions::FromConfig(config), quality, resources, cache,
                                                        monitoring, engine, breaker, workflows, wheel, sleeper);
  }

  ~Harness() {
    coordinator.reset();
    pool->Stop();
  }
};

WorkflowRequest Request(const std::string& user = "user-1") {
  WorkflowRequest request;
  request.set_type("room-layout");
  request.set_user_id(user);
  request.set_subscription_tier(SUBSCRIPTION_TIER_STANDARD);
  request.set_quality_target(QUALITY_TARGET_MEDIUM);
  (*request.mutable_parameters())["room-type"] = "kitchen";
  (*request.mutable_parameters())["room-size"] = "large";
  return request;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateSubmitsJob() {
  Harness h;
  const auto result = h.coordinator->CreateWorkflow(Request());

  assert(!result.cache_hit);
  assert(result.workflow_id.rfind("room-layout-", 0) == 0);
  assert(result.status.status() == WORKFLOW_PHASE_PENDING);
  assert(result.status.quality_level() == QUALITY_LEVEL_MEDIUM);
  assert(result.status.allocation().node_pool() != NODE_POOL_UNSPECIFIED);

  assert(h.engine->Submitted() == 1);
  const auto& job = h.engine->submitted[0];
  assert(job.name == result.workflow_id);
  assert(job.workflow_type == "room-layout");
  assert(job.service_account == "workflow-runner");
  assert(job.labels.at("coordinator/workflow-type") == "room-layout");
  assert(job.labels.at("coordinator/quality-level") == "medium");
  assert(job.labels.at("coordinator/tier") == "standard");
  assert(job.arguments.at("room-type") == "kitchen");

  const auto stored = h.workflows->Get(result.workflow_id);
  assert(stored.has_value());
  assert(stored->submit_attempts() == 1);
  assert(stored->cacheable());
  assert(!stored->cache_key().empty());
  // priority defaulted from the request before allocation
  assert(stored->request().priority() != PRIORITY_UNSPECIFIED);
}

void TestIdenticalRequestsShareOneWorkflow() {
  Harness h;
  const auto first  = h.coordinator->CreateWorkflow(Request("user-1"));
  const auto second = h.coordinator->CreateWorkflow(Request("user-2"));

  assert(!first.cache_hit);
  assert(second.cache_hit);
  assert(second.workflow_id == first.workflow_id);
  assert(second.status.cache_hit());
  assert(h.engine->Submitted() == 1);

  h.monitoring->Flush();
  const auto stats = h.monitoring->GetStats().by_type().at("room-layout");
  assert(stats.cache_hits() == 1);
  assert(stats.cache_misses() == 1);
}

void TestCacheHitCarriesOnlyTheCallersView() {
  Harness h;
  const auto first  = h.coordinator->CreateWorkflow(Request("user-1"));
  const auto second = h.coordinator->CreateWorkflow(Request("user-2"));

  assert(second.cache_hit);
  assert(second.status.id() == first.workflow_id);
  assert(second.status.user_id() == "user-2");
  assert(second.status.quality_level() == QUALITY_LEVEL_MEDIUM);
  assert(second.status.status() == WORKFLOW_PHASE_PENDING);
  // the producer's allocation and quality factors stay with the producer
  assert(!second.status.has_allocation());
  assert(second.status.quality_factors_size() == 0);
}

void TestClampedTierNeverSharesHigherQualityResult() {
  Harness h;
  auto premium = Request("user-1");
  premium.set_subscription_tier(SUBSCRIPTION_TIER_PREMIUM);
  premium.set_quality_target(QUALITY_TARGET_HIGH);

  auto free = Request("user-2");
  free.set_subscription_tier(SUBSCRIPTION_TIER_FREE);
  free.set_quality_target(QUALITY_TARGET_HIGH);

  const auto high    = h.coordinator->CreateWorkflow(premium);
  const auto clamped = h.coordinator->CreateWorkflow(free);

  assert(high.status.quality_level() == QUALITY_LEVEL_HIGH);
  assert(!clamped.cache_hit);
  assert(clamped.workflow_id != high.workflow_id);
  assert(clamped.status.quality_level() == QUALITY_LEVEL_LOW);
  assert(h.engine->Submitted() == 2);
}

void TestCachingCanBeDisabledPerRequest() {
  Harness h;
  auto request = Request();
  request.set_enable_caching(false);

  const auto first  = h.coordinator->CreateWorkflow(request);
  const auto second = h.coordinator->CreateWorkflow(request);
  assert(!second.cache_hit);
  assert(first.workflow_id != second.workflow_id);
  assert(h.engine->Submitted() == 2);
  assert(h.workflows->Get(first.workflow_id)->cache_key().empty());
}

void TestSubmitFailureAfterRetriesIsRecorded() {
  Harness h;
  h.engine->failing_submits = 3;

  const auto result = h.coordinator->CreateWorkflow(Request());
  assert(!result.cache_hit);
  assert(result.status.status() == WORKFLOW_PHASE_ERROR);
  assert(result.status.message().find("submit failed after 3 attempt(s)") == 0);
  assert(h.engine->submit_calls == 3);
  assert(h.sleeper.delays->size() == 2);
  assert(h.sleeper.delays->at(0).count() == 100);
  assert(h.sleeper.delays->at(1).count() == 200);

  const auto stored = h.workflows->Get(result.workflow_id);
  assert(stored->status().status() == WORKFLOW_PHASE_ERROR);
  assert(stored->submit_attempts() == 3);
  assert(stored->request().parameters().at("room-type") == "kitchen");
  assert(h.coordinator->ListActiveWorkflows("").empty());

  // the claim was released, so the same request is submitted afresh
  const auto retry = h.coordinator->CreateWorkflow(Request());
  assert(!retry.cache_hit);
  assert(retry.workflow_id != result.workflow_id);
  assert(h.engine->Submitted() == 1);
}

void TestSubmitSucceedsWithinRetryBudget() {
  Harness h;
  h.engine->failing_submits = 2;

  const auto result = h.coordinator->CreateWorkflow(Request());
  assert(result.status.status() == WORKFLOW_PHASE_PENDING);
  assert(h.workflows->Get(result.workflow_id)->submit_attempts() == 3);
}

void TestRejectedJobIsNotRetried() {
  Harness h;
  h.engine->reject_submits = true;

  assert(Throws<coordinator::util::ValidationError>([&] { h.coordinator->CreateWorkflow(Request()); }));
  assert(h.engine->submit_calls == 1);
  assert(h.sleeper.delays->empty());

  // an errored record is terminal: persisted, but out of the active index
  const auto keys = h.store->ListKeys("records:workflow:");
  assert(keys.size() == 1);
  assert(h.workflows->ListActive().empty());
  const auto record = h.workflows->Get(keys[0].substr(std::string("records:workflow:").size()));
  assert(record.has_value());
  assert(record->status().status() == WORKFLOW_PHASE_ERROR);
}

void TestInvalidRequestsAreRejected() {
  Harness h;

  auto bad_type = Request();
  bad_type.set_type("Room_Layout");
  assert(Throws<coordinator::util::ValidationError>([&] { h.coordinator->CreateWorkflow(bad_type); }));

  auto dash = Request();
  dash.set_type("-room");
  assert(Throws<coordinator::util::ValidationError>([&] { h.coordinator->CreateWorkflow(dash); }));

  auto no_user = Request("");
  assert(Throws<coordinator::util::ValidationError>([&] { h.coordinator->CreateWorkflow(no_user); }));

  auto empty_key = Request();
  (*empty_key.mutable_parameters())[""] = "x";
  assert(Throws<coordinator::util::ValidationError>([&] { h.coordinator->CreateWorkflow(empty_key); }));

  assert(h.engine->submit_calls == 0);
  assert(h.store->ListKeys("records:workflow:").empty());
}

void TestStrictQualityAboveTierFails() {
  Harness h;
  auto request = Request();
  request.set_subscription_tier(SUBSCRIPTION_TIER_FREE);
  request.set_quality_target(QUALITY_TARGET_HIGH);
  request.set_strict_quality(true);

  bool threw = false;
  try {
    h.coordinator->CreateWorkflow(request);
  } catch (const coordinator::util::QuotaError& e) {
    threw = true;
    assert(e.PermittedCeiling() == "low");
  }
  assert(threw);
  assert(h.engine->submit_calls == 0);

  // without strict the level is clamped and the workflow runs
  request.set_strict_quality(false);
  const auto result = h.coordinator->CreateWorkflow(request);
  assert(result.status.quality_level() == QUALITY_LEVEL_LOW);
}

void TestCancelIsTerminalAndReleasesClaim() {
  Harness h;
  const auto created   = h.coordinator->CreateWorkflow(Request());
  const auto cancelled = h.coordinator->CancelWorkflow(created.workflow_id);

  assert(cancelled.status() == WORKFLOW_PHASE_FAILED);
  assert(cancelled.message() == "cancelled");
  assert(coordinator::util::IsSet(cancelled.finished_at()));
  assert(h.engine->terminated.size() == 1);
  assert(h.engine->terminated[0] == created.workflow_id);

  assert(Throws<coordinator::util::InvalidState>([&] { h.coordinator->CancelWorkflow(created.workflow_id); }));
  assert(Throws<coordinator::util::NotFound>([&] { h.coordinator->CancelWorkflow("room-layout-missing"); }));

  // a cancelled workflow never becomes a cache hit
  const auto again = h.coordinator->CreateWorkflow(Request());
  assert(!again.cache_hit);

  h.monitoring->Flush();
  assert(h.monitoring->GetStats().by_type().at("room-layout").cancelled() == 1);
}

void TestReconcileToSuccessCompletesCache() {
  Harness h;
  const auto created = h.coordinator->CreateWorkflow(Request());

  coordinator::cluster::EngineWorkflowStatus running;
  running.phase         = WORKFLOW_PHASE_RUNNING;
  running.started_at_ms = coordinator::util::NowMillis();
  running.nodes.push_back({"n1", "layout", "", "Pod", "run-inference", WORKFLOW_PHASE_RUNNING, "", running.started_at_ms, 0});
  h.engine->SetStatus(created.workflow_id, running);

  assert(h.coordinator->Reconcile(created.workflow_id));
  auto status = h.coordinator->GetWorkflow(created.workflow_id);
  assert(status.status() == WORKFLOW_PHASE_RUNNING);
  assert(status.nodes_size() == 1);
  assert(h.coordinator->CountActive("room-layout") == 1);

  auto done           = running;
  done.phase          = WORKFLOW_PHASE_SUCCEEDED;
  done.finished_at_ms = running.started_at_ms + 2000;
  done.nodes[0].phase = WORKFLOW_PHASE_SUCCEEDED;
  done.nodes[0].finished_at_ms = done.finished_at_ms;
  done.outputs        = "{\"layout\":\"s3://results/layout.json\"}";
  h.engine->SetStatus(created.workflow_id, done);

  status = h.coordinator->GetWorkflow(created.workflow_id);
  assert(status.status() == WORKFLOW_PHASE_SUCCEEDED);
  assert(status.progress() == 100);
  assert(h.coordinator->CountActive("room-layout") == 0);
  assert(!h.coordinator->Reconcile(created.workflow_id));

  const auto key    = h.workflows->Get(created.workflow_id)->cache_key();
  const auto cached = h.cache->Get(key);
  assert(cached.has_value());
  assert(cached->workflow_id() == created.workflow_id);
  assert(cached->result() == done.outputs);

  const auto hit = h.coordinator->CreateWorkflow(Request("user-9"));
  assert(hit.cache_hit);
  assert(hit.workflow_id == created.workflow_id);
  assert(hit.status.status() == WORKFLOW_PHASE_SUCCEEDED);
  assert(h.engine->Submitted() == 1);

  h.monitoring->Flush();
  const auto metrics = h.store->Tail("metrics:workflow:room-layout", 10);
  assert(metrics.size() == 1);
}

void TestFailedWorkflowIsNotCached() {
  Harness h;
  const auto created = h.coordinator->CreateWorkflow(Request());

  coordinator::cluster::EngineWorkflowStatus failed;
  failed.phase   = WORKFLOW_PHASE_FAILED;
  failed.message = "OOMKilled";
  h.engine->SetStatus(created.workflow_id, failed);

  const auto status = h.coordinator->GetWorkflow(created.workflow_id);
  assert(status.status() == WORKFLOW_PHASE_FAILED);
  assert(status.message() == "OOMKilled");

  const auto again = h.coordinator->CreateWorkflow(Request());
  assert(!again.cache_hit);
}

void TestVanishedWorkflowBecomesError() {
  Harness h;
  const auto created = h.coordinator->CreateWorkflow(Request());
  {
    std::lock_guard lock(h.engine->mutex_);
    h.engine->submitted.clear();
  }

  const auto status = h.coordinator->GetWorkflow(created.workflow_id);
  assert(status.status() == WORKFLOW_PHASE_ERROR);
  assert(status.message() == "workflow no longer exists in the execution engine");
}

void TestOpenBreakerServesStoredStatus() {
  Harness h;
  const auto created = h.coordinator->CreateWorkflow(Request());
  for (int i = 0; i < 5; ++i) h.breaker->RecordFailure();
  assert(h.breaker->CurrentState() == coordinator::scheduling::CircuitBreaker::State::kOpen);

  const auto polls  = h.engine->poll_calls;
  const auto status = h.coordinator->GetWorkflow(created.workflow_id);
  assert(status.status() == WORKFLOW_PHASE_PENDING);
  assert(h.engine->poll_calls == polls);

  // submissions fail fast while the circuit is open
  auto other = Request();
  (*other.mutable_parameters())["room-type"] = "office";
  const auto rejected = h.coordinator->CreateWorkflow(other);
  assert(rejected.status.status() == WORKFLOW_PHASE_ERROR);
  assert(h.engine->submit_calls == 1);
}

void TestGetUnknownWorkflow() {
  Harness h;
  assert(Throws<coordinator::util::NotFound>([&] { h.coordinator->GetWorkflow("room-layout-unknown"); }));
}

void TestListActiveFiltersByUser() {
  Harness h;
  auto a = Request("alice");
  auto b = Request("bob");
  (*b.mutable_parameters())["room-type"] = "office";
  auto c = Request("alice");
  (*c.mutable_parameters())["room-type"] = "bedroom";

  const auto first  = h.coordinator->CreateWorkflow(a);
  h.coordinator->CreateWorkflow(b);
  const auto third  = h.coordinator->CreateWorkflow(c);

  assert(h.coordinator->ListActiveWorkflows("").size() == 3);

  const auto alice = h.coordinator->ListActiveWorkflows("alice");
  assert(alice.size() == 2);
  for (const auto& status : alice) {
    assert(status.user_id() == "alice");
    assert(status.id() == first.workflow_id || status.id() == third.workflow_id);
  }

  h.coordinator->CancelWorkflow(first.workflow_id);
  assert(h.coordinator->ListActiveWorkflows("alice").size() == 1);
  assert(h.coordinator->ListActiveWorkflows("carol").empty());
}

void TestFinishedWorkflowsLeaveTheActiveIndex() {
  Harness h;
  for (const char* room : {"kitchen", "office", "bedroom"}) {
    auto request = Request();
    (*request.mutable_parameters())["room-type"] = room;
    h.coordinator->CreateWorkflow(request);
  }
  assert(h.workflows->ListActive().size() == 3);
  assert(h.coordinator->CountActive("room-layout") == 3);

  const auto done_id = h.workflows->ListActive()[0].status().id();
  coordinator::cluster::EngineWorkflowStatus done;
  done.phase          = WORKFLOW_PHASE_SUCCEEDED;
  done.started_at_ms  = coordinator::util::NowMillis();
  done.finished_at_ms = done.started_at_ms + 1000;
  h.engine->SetStatus(done_id, done);
  assert(!h.coordinator->Reconcile(done_id));

  assert(h.workflows->ListActive().size() == 2);
  assert(h.coordinator->CountActive("room-layout") == 2);
  assert(h.coordinator->CountActive("scene-graph-generation") == 0);

  // terminal records are still readable from the store
  const auto finished = h.workflows->Get(done_id);
  assert(finished.has_value());
  assert(finished->status().status() == WORKFLOW_PHASE_SUCCEEDED);
  assert(h.coordinator->GetWorkflow(done_id).status() == WORKFLOW_PHASE_SUCCEEDED);
}

void TestWorkflowMutexesDoNotAccumulate() {
  Harness h;
  assert(Throws<coordinator::util::NotFound>([&] { h.coordinator->CancelWorkflow("room-layout-missing"); }));
  assert(h.workflows->TrackedMutexes() == 0);

  for (int i = 0; i < 300; ++i) {
    auto request = Request();
    request.set_enable_caching(false);
    h.coordinator->CreateWorkflow(request);
  }
  // released ids are swept as new ones arrive
  assert(h.workflows->TrackedMutexes() <= 64);

  // a held mutex is shared, not replaced
  auto held  = h.workflows->WorkflowMutex("room-layout-held");
  auto again = h.workflows->WorkflowMutex("room-layout-held");
  assert(held == again);
}

void TestSubmittedWorkflowIsPolledWhenRecordWriteFails() {
  auto records            = std::make_shared<coordinator::testing::FlakyStore>();
  records->failing_prefix = "records:workflow:";
  records->allowed_writes = 1;
  records->failing_writes = 1;

  Harness    h(records);
  const auto created = h.coordinator->CreateWorkflow(Request());

  assert(records->failed == 1);
  assert(h.engine->Submitted() == 1);
  assert(created.status.status() == WORKFLOW_PHASE_PENDING);
  assert(h.coordinator->Polling(created.workflow_id));

  // the pre-submit record is still there, so reconciliation carries on
  coordinator::cluster::EngineWorkflowStatus done;
  done.phase          = WORKFLOW_PHASE_SUCCEEDED;
  done.started_at_ms  = coordinator::util::NowMillis();
  done.finished_at_ms = done.started_at_ms + 500;
  h.engine->SetStatus(created.workflow_id, done);
  assert(!h.coordinator->Reconcile(created.workflow_id));
  assert(h.coordinator->GetWorkflow(created.workflow_id).status() == WORKFLOW_PHASE_SUCCEEDED);
}

} // namespace

int main() {
  TestCreateSubmitsJob();
  TestIdenticalRequestsShareOneWorkflow();
  TestCacheHitCarriesOnlyTheCallersView();
  TestClampedTierNeverSharesHigherQualityResult();
  TestCachingCanBeDisabledPerRequest();
  TestSubmitFailureAfterRetriesIsRecorded();
  TestSubmitSucceedsWithinRetryBudget();
  TestRejectedJobIsNotRetried();
  TestInvalidRequestsAreRejected();
  TestStrictQualityAboveTierFails();
  TestCancelIsTerminalAndReleasesClaim();
  TestReconcileToSuccessCompletesCache();
  TestFailedWorkflowIsNotCached();
  TestVanishedWorkflowBecomesError();
  TestOpenBreakerServesStoredStatus();
  TestGetUnknownWorkflow();
  TestListActiveFiltersByUser();
  TestFinishedWorkflowsLeaveTheActiveIndex();
  TestWorkflowMutexesDoNotAccumulate();
  TestSubmittedWorkflowIsPolledWhenRecordWriteFails();

  std::cout << "coordinator_unit_workflow_coordinator: pass\n";
  return 0;
}
