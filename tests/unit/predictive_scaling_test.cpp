#include <cassert>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/memory/memory_store.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/scaling/decision_log.hpp"
#include "internal/scaling/predictive_scaling_service.hpp"
#include "internal/scaling/scaling_listener.hpp"
#include "internal/scaling/signal_history.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using coordinator::db::memory::MemoryStore;
using coordinator::monitoring::MonitoringService;
using coordinator::runtime::config::PredictiveScalingConfig;
using coordinator::scaling::DecisionLog;
using coordinator::scaling::PredictiveScalingService;
using coordinator::testing::FakeAutoscaler;
using coordinator::testing::RecordingSleeper;

class RecordingListener final : public coordinator::scaling::ScalingListener {
 public:
  void OnScalingEvent(const std::string& workload, uint32_t old_replicas, uint32_t new_replicas) override {
    events.emplace_back(workload, old_replicas, new_replicas);
  }

  std::vector<std::tuple<std::string, uint32_t, uint32_t>> events;
};

// history_window 1 makes the moving average equal to the last sample.
PredictiveScalingConfig OneWorkload(uint32_t max_replicas = 20) {
  PredictiveScalingConfig config;
  config.set_history_window(1);
  config.set_scale_up_margin(0.1);
  config.set_scale_down_margin(0.3);
  config.set_scale_down_ticks(3);
  config.mutable_retry()->set_max_attempts(3);
  config.mutable_retry()->set_initial_backoff_ms(10);

  auto* workload = config.add_workloads();
  workload->set_name("inference-workers");
  workload->set_workflow_type("room-layout");
  workload->set_min_replicas(1);
  workload->set_max_replicas(max_replicas);
  workload->set_capacity_per_replica(1.0);
  return config;
}

struct Harness {
  std::shared_ptr<MemoryStore>                 store       = std::make_shared<MemoryStore>();
  std::shared_ptr<FakeAutoscaler>              autoscaler  = std::make_shared<FakeAutoscaler>();
  std::shared_ptr<MonitoringService>           monitoring  = std::make_shared<MonitoringService>(coordinator::runtime::config::ObservabilityConfig{}, store);
  std::shared_ptr<RecordingListener>           listener    = std::make_shared<RecordingListener>();
  std::shared_ptr<std::map<std::string, double>> load      = std::make_shared<std::map<std::string, double>>();
  RecordingSleeper                             sleeper;
  std::unique_ptr<PredictiveScalingService>    service;

  explicit Harness(const PredictiveScalingConfig& config) {
    auto loads = load;
    service    = std::make_unique<PredictiveScalingService>(
        config, autoscaler, monitoring, store, [loads](const std::string& type) { return (*loads)[type]; }, sleeper);
    service->SetListener(listener);
  }

  void SetLoad(double value) {
    (*load)["room-layout"] = value;
  }
};

void TestScalesUpAheadOfDemand() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 2, 2);
  h.SetLoad(10);

  h.service->Tick();

  assert(h.autoscaler->directives.size() == 1);
  assert(h.autoscaler->directives[0].second == 10);
  assert(h.listener->events.size() == 1);
  assert(std::get<1>(h.listener->events[0]) == 2);
  assert(std::get<2>(h.listener->events[0]) == 10);

  const auto decisions = DecisionLog(h.store).Recent("inference-workers", 10);
  assert(decisions.size() == 1);
  assert(decisions[0].direction() == coordinator::v1::SCALING_DIRECTION_UP);
  assert(decisions[0].replicas_before() == 2);
  assert(decisions[0].replicas_after() == 10);
  assert(decisions[0].source() == coordinator::v1::SCALING_SOURCE_PREDICTIVE);
}

void TestScaleUpStopsAtMaxReplicas() {
  Harness h(OneWorkload(6));
  h.autoscaler->Put("inference-workers", 2, 2);
  h.SetLoad(50);

  h.service->Tick();

  assert(h.autoscaler->directives.size() == 1);
  assert(h.autoscaler->directives[0].second == 6);

  // already at the ceiling: forecast is still high but nothing to add
  h.service->Tick();
  assert(h.autoscaler->directives.size() == 1);
}

void TestHugeForecastSaturatesReplicaCount() {
  Harness bounded(OneWorkload(6));
  bounded.autoscaler->Put("inference-workers", 2, 2);
  bounded.SetLoad(5e9);
  bounded.service->Tick();
  assert(bounded.autoscaler->directives.size() == 1);
  assert(bounded.autoscaler->directives[0].second == 6);

  // max_replicas 0 is unbounded: the directive saturates rather than wrapping
  Harness unbounded(OneWorkload(0));
  unbounded.autoscaler->Put("inference-workers", 2, 2);
  unbounded.SetLoad(5e9);
  unbounded.service->Tick();
  assert(unbounded.autoscaler->directives.size() == 1);
  assert(unbounded.autoscaler->directives[0].second == std::numeric_limits<uint32_t>::max());
}

void TestSeasonalForecastSeesAFullSeason() {
  auto config = OneWorkload();
  config.set_forecaster(coordinator::runtime::config::FORECASTER_KIND_SEASONAL_NAIVE);
  config.set_season_length(4);
  Harness h(config);
  h.autoscaler->Put("inference-workers", 10, 10);

  // a quiet stretch after a peak; the peak recurs one season later
  for (double load : {10.0, 1.0, 1.0}) {
    h.SetLoad(load);
    h.service->Tick();
  }
  assert(h.autoscaler->directives.empty());

  // the fourth sample completes the season, so the forecast repeats the
  // peak and the third quiet tick does not scale down
  h.service->Tick();
  assert(h.autoscaler->directives.empty());
}

void TestPendingReplicasCountAsCapacity() {
  Harness h(OneWorkload());
  // 4 running, 10 already requested
  h.autoscaler->Put("inference-workers", 4, 10);
  h.SetLoad(10);

  h.service->Tick();
  assert(h.autoscaler->directives.empty());
}

void TestScaleDownWaitsForConsecutiveTicks() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 10, 10);
  h.SetLoad(2);

  h.service->Tick();
  h.service->Tick();
  assert(h.autoscaler->directives.empty());

  h.service->Tick();
  assert(h.autoscaler->directives.size() == 1);
  assert(h.autoscaler->directives[0].second == 2);
  assert(h.listener->events.size() == 1);
  assert(std::get<1>(h.listener->events[0]) == 10);
  assert(std::get<2>(h.listener->events[0]) == 2);
}

void TestInBandTickResetsScaleDownStreak() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 10, 10);

  h.SetLoad(2);
  h.service->Tick();
  h.service->Tick();

  // within the margins of 10 replicas
  h.SetLoad(9);
  h.service->Tick();

  h.SetLoad(2);
  h.service->Tick();
  h.service->Tick();
  assert(h.autoscaler->directives.empty());

  h.service->Tick();
  assert(h.autoscaler->directives.size() == 1);
}

void TestScaleDownNeverGoesBelowMinReplicas() {
  auto config = OneWorkload();
  config.mutable_workloads(0)->set_min_replicas(3);
  Harness h(config);
  h.autoscaler->Put("inference-workers", 8, 8);
  h.SetLoad(0);

  for (int i = 0; i < 3; ++i) h.service->Tick();

  assert(h.autoscaler->directives.size() == 1);
  assert(h.autoscaler->directives[0].second == 3);
}

void TestTransientDirectiveFailureIsRetried() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 2, 2);
  h.autoscaler->failing_sets = 2;
  h.SetLoad(5);

  h.service->Tick();

  assert(h.autoscaler->set_calls == 3);
  assert(h.autoscaler->directives.size() == 1);
  assert(h.sleeper.delays->size() == 2);
  assert(h.sleeper.delays->at(0).count() == 10);
  assert(h.sleeper.delays->at(1).count() == 20);
  assert(h.listener->events.size() == 1);
}

void TestExhaustedRetriesRecordScalingError() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 2, 2);
  h.autoscaler->failing_sets = 5;
  h.SetLoad(5);

  h.service->Tick();

  assert(h.autoscaler->set_calls == 3);
  assert(h.autoscaler->directives.empty());
  assert(h.listener->events.empty());
  assert(DecisionLog(h.store).Recent("inference-workers", 10).empty());

  h.monitoring->Flush();
  const auto text = h.monitoring->Scrape();
  assert(text.find("coordinator_scaling_errors_total{") != std::string::npos);
  assert(text.find("source=\"predictive\"") != std::string::npos);
}

void TestUnknownWorkloadIsSkipped() {
  Harness h(OneWorkload());
  h.SetLoad(5);

  // GetScale answers NotFound; the tick logs and moves on
  h.service->Tick();
  assert(h.autoscaler->directives.empty());
}

void TestSamplesAndSignalsShareOneSeries() {
  Harness h(OneWorkload());
  h.autoscaler->Put("inference-workers", 2, 2);
  h.SetLoad(1);

  coordinator::v1::ScalingSignal signal;
  signal.set_workload("inference-workers");
  signal.set_value(7.5);
  h.service->RecordSignal(signal);

  const auto recorded = coordinator::scaling::SignalHistory(h.store, 100).Recent("inference-workers", 10);
  assert(recorded.size() == 1);
  assert(recorded[0].metric() == "external");
  assert(recorded[0].timestamp_ms() > 0);

  h.service->Tick();
  assert(coordinator::scaling::SignalHistory(h.store, 100).Recent("inference-workers", 10).size() == 2);
}

void TestRecordSignalValidation() {
  Harness h(OneWorkload());

  coordinator::v1::ScalingSignal missing_workload;
  missing_workload.set_value(1.0);
  bool threw = false;
  try {
    h.service->RecordSignal(missing_workload);
  } catch (const coordinator::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  coordinator::v1::ScalingSignal negative;
  negative.set_workload("inference-workers");
  negative.set_value(-1.0);
  threw = false;
  try {
    h.service->RecordSignal(negative);
  } catch (const coordinator::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidWorkloadConfigIsRejected() {
  auto config = OneWorkload();
  config.mutable_workloads(0)->set_min_replicas(5);
  config.mutable_workloads(0)->set_max_replicas(2);

  bool threw = false;
  try {
    Harness h(config);
  } catch (const coordinator::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestStartAndCloseAreIdempotent() {
  auto config = OneWorkload();
  config.set_tick_interval_ms(3600000);
  Harness h(config);

  assert(h.service->CurrentState() == PredictiveScalingService::State::kStopped);
  h.service->Start();
  h.service->Start();
  assert(h.service->CurrentState() == PredictiveScalingService::State::kRunning);
  h.service->Close();
  h.service->Close();
  assert(h.service->CurrentState() == PredictiveScalingService::State::kStopped);
}

} // namespace

int main() {
  TestScalesUpAheadOfDemand();
  TestScaleUpStopsAtMaxReplicas();
  TestHugeForecastSaturatesReplicaCount();
  TestSeasonalForecastSeesAFullSeason();
  TestPendingReplicasCountAsCapacity();
  TestScaleDownWaitsForConsecutiveTicks();
  TestInBandTickResetsScaleDownStreak();
  TestScaleDownNeverGoesBelowMinReplicas();
  TestTransientDirectiveFailureIsRetried();
  TestExhaustedRetriesRecordScalingError();
  TestUnknownWorkloadIsSkipped();
  TestSamplesAndSignalsShareOneSeries();
  TestRecordSignalValidation();
  TestInvalidWorkloadConfigIsRejected();
  TestStartAndCloseAreIdempotent();

  std::cout << "coordinator_unit_predictive_scaling: pass\n";
  return 0;
}
