#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cluster/autoscaling_api.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/scaling/hpa_event_logger.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using namespace coordinator::v1;
using coordinator::cluster::ScaleStatus;
using coordinator::scaling::HpaEventLogger;

ScaleStatus Scale(uint32_t current, uint32_t desired, uint32_t max = 10) {
  ScaleStatus status;
  status.workload         = "inference-workers";
  status.current_replicas = current;
  status.desired_replicas = desired;
  status.min_replicas     = 1;
  status.max_replicas     = max;
  return status;
}

void TestClassify() {
  assert(HpaEventLogger::Classify(Scale(2, 4)) == HPA_EVENT_TYPE_SCALE_UP);
  assert(HpaEventLogger::Classify(Scale(6, 3)) == HPA_EVENT_TYPE_SCALE_DOWN);
  assert(HpaEventLogger::Classify(Scale(5, 5)) == HPA_EVENT_TYPE_NO_SCALE);
  // wants to grow but is pinned at the ceiling
  assert(HpaEventLogger::Classify(Scale(8, 10)) == HPA_EVENT_TYPE_LIMITED_SCALE);
  // no ceiling configured
  assert(HpaEventLogger::Classify(Scale(8, 40, 0)) == HPA_EVENT_TYPE_SCALE_UP);
}

struct Harness {
  std::shared_ptr<coordinator::db::memory::MemoryStore>       store      = std::make_shared<coordinator::db::memory::MemoryStore>();
  std::shared_ptr<coordinator::testing::FakeAutoscaler>       autoscaler = std::make_shared<coordinator::testing::FakeAutoscaler>();
  std::shared_ptr<coordinator::monitoring::MonitoringService> monitoring =
      std::make_shared<coordinator::monitoring::MonitoringService>(coordinator::runtime::config::ObservabilityConfig{});
  std::chrono::steady_clock::time_point                       now{};
  std::unique_ptr<HpaEventLogger>                             logger;

  Harness() {
    coordinator::runtime::config::HpaEventLoggingConfig config;
    config.set_min_event_interval_ms(60000);
    logger = std::make_unique<HpaEventLogger>(config, std::vector<std::string>{"inference-workers", "feature-store"}, autoscaler, monitoring,
                                              store, [this] { return now; });
  }

  std::size_t Events(const std::string& workload) {
    return store->Tail(HpaEventLogger::Key(workload), 100).size();
  }
};

void TestEventsAreDebouncedPerWorkload() {
  Harness h;
  h.autoscaler->Put("inference-workers", 2, 4);
  h.autoscaler->Put("feature-store", 3, 3);

  h.logger->Check();
  assert(h.Events("inference-workers") == 1);
  // steady state is not an event
  assert(h.Events("feature-store") == 0);

  // still scaling a few seconds later: inside the debounce window
  h.now += 5s;
  h.logger->Check();
  assert(h.Events("inference-workers") == 1);

  h.now += 60s;
  h.logger->Check();
  assert(h.Events("inference-workers") == 2);

  // the window is per workload
  h.autoscaler->Put("feature-store", 3, 1);
  h.logger->Check();
  assert(h.Events("feature-store") == 1);
}

void TestEventCarriesScaleDetails() {
  Harness h;
  h.autoscaler->Put("inference-workers", 8, 10);
  {
    std::lock_guard lock(h.autoscaler->mutex_);
    auto& scale             = h.autoscaler->scales["inference-workers"];
    scale.trigger_value     = 0.92;
    scale.trigger_threshold = 0.75;
  }

  h.logger->Check();

  const auto raw = h.store->Tail(HpaEventLogger::Key("inference-workers"), 1);
  assert(raw.size() == 1);
  HpaEvent event;
  assert(event.ParseFromString(raw[0]));
  assert(event.type() == HPA_EVENT_TYPE_LIMITED_SCALE);
  assert(event.current_replicas() == 8);
  assert(event.desired_replicas() == 10);
  assert(event.max_replicas() == 10);
  assert(event.trigger_metric() == "cpu");
  assert(event.trigger_value() == 0.92);
  assert(event.timestamp_ms() > 0);

  h.monitoring->Flush();
  const auto text = h.monitoring->Scrape();
  assert(text.find("coordinator_hpa_events_total{") != std::string::npos);
  assert(text.find("event=\"limited-scale\"") != std::string::npos);
}

void TestUnreadableWorkloadDoesNotStopOthers() {
  Harness h;
  // inference-workers has no HPA
  h.autoscaler->Put("feature-store", 4, 2);

  h.logger->Check();
  assert(h.Events("inference-workers") == 0);
  assert(h.Events("feature-store") == 1);
}

void TestStartStop() {
  Harness h;
  h.logger->Start();
  h.logger->Start();
  h.logger->Stop();
  h.logger->Stop();
}

} // namespace

int main() {
  TestClassify();
  TestEventsAreDebouncedPerWorkload();
  TestEventCarriesScaleDetails();
  TestUnreadableWorkloadDoesNotStopOthers();
  TestStartStop();

  std::cout << "coordinator_unit_hpa_event_logger: pass\n";
  return 0;
}
