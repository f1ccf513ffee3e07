#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/scaling/v1/scaling.pb.h"

namespace coordinator::cluster {
class AutoscalingApi;
struct ScaleStatus;
}
namespace coordinator::db {
class KvStore;
}
namespace coordinator::monitoring {
class MonitoringService;
}
namespace coordinator::scheduling {
class PeriodicTask;
}

namespace coordinator::scaling {

/*
  Periodically reads the autoscaler state of watched workloads and keeps
  an event trail of what the autoscaler decided on its own. Events other
  than no-scale are debounced per workload.
*/
class HpaEventLogger {
 public:
  using SteadyClock = std::chrono::steady_clock;
  using ClockFn     = std::function<SteadyClock::time_point()>;

  HpaEventLogger(const coordinator::runtime::config::HpaEventLoggingConfig& config, std::vector<std::string> workloads,
                 std::shared_ptr<cluster::AutoscalingApi> autoscaler, std::shared_ptr<monitoring::MonitoringService> monitoring,
                 std::shared_ptr<db::KvStore> store, ClockFn clock = {});
  ~HpaEventLogger();

  void Start();
  void Stop();

  // One pass over every workload.
  void Check();

  static coordinator::v1::HpaEventType Classify(const cluster::ScaleStatus& status);

  static std::string Key(const std::string& workload);

 private:
  std::optional<coordinator::v1::HpaEvent> Observe(const std::string& workload);

  std::vector<std::string>                       workloads_;
  std::chrono::milliseconds                      interval_;
  std::chrono::milliseconds                      min_event_interval_;
  std::shared_ptr<cluster::AutoscalingApi>       autoscaler_;
  std::shared_ptr<monitoring::MonitoringService> monitoring_;
  std::shared_ptr<db::KvStore>                   store_;
  ClockFn                                        clock_;

  std::mutex                                         mutex_;
  std::map<std::string, SteadyClock::time_point>     last_event_;
  std::unique_ptr<scheduling::PeriodicTask>          task_;
};

} // namespace coordinator::scaling
