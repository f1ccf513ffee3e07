#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/scaling/v1/scaling.pb.h"
#include "decision_log.hpp"
#include "forecaster.hpp"
#include "internal/scheduling/retry_policy.hpp"
#include "signal_history.hpp"

namespace coordinator::cluster {
class AutoscalingApi;
}
namespace coordinator::monitoring {
class MonitoringService;
}
namespace coordinator::scheduling {
class PeriodicTask;
}

namespace coordinator::scaling {

class ScalingListener;

struct WatchedWorkload {
  std::string name;
  std::string workflow_type;
  uint32_t    min_replicas         = 1;
  uint32_t    max_replicas         = 0;
  double      capacity_per_replica = 1.0;

  // Replica count within [min, max]; max 0 means unbounded.
  uint32_t Clamp(double replicas) const;
};

/*
  Scales watched workloads ahead of demand.

  Each tick samples the current load of every workload, forecasts the next
  value from the recent signal window and compares it against the capacity
  of the replicas that are running or already requested:

    forecast > capacity * (1 + up_margin)     scale up immediately
    forecast < capacity * (1 - down_margin)   scale down after
                                              scale_down_ticks in a row

  Anything in between resets the scale-down streak, so a single dip never
  removes capacity.
*/
class PredictiveScalingService {
 public:
  enum class State { kStopped, kRunning };

  // Current load for a workflow type, in the same units as capacity_per_replica.
  using LoadSampler = std::function<double(const std::string& workflow_type)>;

  PredictiveScalingService(const coordinator::runtime::config::PredictiveScalingConfig& config,
                           std::shared_ptr<cluster::AutoscalingApi> autoscaler, std::shared_ptr<monitoring::MonitoringService> monitoring,
                           std::shared_ptr<db::KvStore> store, LoadSampler sampler, scheduling::RetryPolicy::Sleeper sleeper = {});
  ~PredictiveScalingService();

  void Start();
  void Close();

  State CurrentState() const;

  // One evaluation pass over every workload. Driven by the timer thread
  // once started.
  void Tick();

  // Externally observed load, merged into the same series as sampled load.
  void RecordSignal(coordinator::v1::ScalingSignal signal);

  void SetListener(std::shared_ptr<ScalingListener> listener);

  const std::vector<WatchedWorkload>& Workloads() const {
    return workloads_;
  }

 private:
  void TickWorkload(const WatchedWorkload& workload);
  void Apply(const WatchedWorkload& workload, coordinator::v1::ScalingDirection direction, double forecast, double capacity,
             uint32_t before, uint32_t after);

  std::vector<WatchedWorkload>                   workloads_;
  std::chrono::milliseconds                      interval_;
  std::size_t                                    window_;
  double                                         up_margin_;
  double                                         down_margin_;
  uint32_t                                       down_ticks_;
  std::unique_ptr<Forecaster>                    forecaster_;
  scheduling::RetryPolicy                        retry_;
  std::shared_ptr<cluster::AutoscalingApi>       autoscaler_;
  std::shared_ptr<monitoring::MonitoringService> monitoring_;
  SignalHistory                                  history_;
  DecisionLog                                    decisions_;
  LoadSampler                                    sampler_;

  mutable std::mutex                         mutex_;
  State                                      state_ = State::kStopped;
  std::unique_ptr<scheduling::PeriodicTask>  task_;
  std::shared_ptr<ScalingListener>           listener_;
  std::map<std::string, uint32_t>            below_streak_;
};

} // namespace coordinator::scaling
