#include "predictive_scaling_service.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/cluster/autoscaling_api.hpp"
#include "internal/model/names.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduling/periodic_task.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "scaling_listener.hpp"

namespace coordinator::scaling {

namespace {

constexpr std::chrono::milliseconds kDefaultInterval{60000};
constexpr std::size_t               kDefaultWindow     = 12;
constexpr double                    kDefaultUpMargin   = 0.1;
constexpr double                    kDefaultDownMargin = 0.3;
constexpr uint32_t                  kDefaultDownTicks  = 3;

std::vector<WatchedWorkload> ParseWorkloads(const coordinator::runtime::config::PredictiveScalingConfig& config) {
  std::vector<WatchedWorkload> out;
  for (const auto& w : config.workloads()) {
    if (w.name().empty()) {
      throw util::ValidationError("predictive_scaling.workloads: name is required");
    }
    WatchedWorkload workload;
    workload.name                 = w.name();
    workload.workflow_type        = w.workflow_type().empty() ? w.name() : w.workflow_type();
    workload.min_replicas         = w.min_replicas() > 0 ? w.min_replicas() : 1;
    workload.max_replicas         = w.max_replicas();
    workload.capacity_per_replica = w.capacity_per_replica() > 0 ? w.capacity_per_replica() : 1.0;
    if (workload.max_replicas != 0 && workload.max_replicas < workload.min_replicas) {
      throw util::ValidationError("predictive_scaling.workloads[" + w.name() + "]: max_replicas below min_replicas");
    }
    out.push_back(std::move(workload));
  }
  return out;
}

} // namespace

uint32_t WatchedWorkload::Clamp(double replicas) const {
  const uint32_t upper = max_replicas == 0 ? std::numeric_limits<uint32_t>::max() : max_replicas;
  // bounded before the cast; an out-of-range double to integer conversion is undefined
  if (std::isnan(replicas) || replicas <= static_cast<double>(min_replicas)) return min_replicas;
  if (replicas >= static_cast<double>(upper)) return upper;
  return static_cast<uint32_t>(replicas);
}

PredictiveScalingService::PredictiveScalingService(const coordinator::runtime::config::PredictiveScalingConfig& config,
                                                   std::shared_ptr<cluster::AutoscalingApi>       autoscaler,
                                                   std::shared_ptr<monitoring::MonitoringService> monitoring,
                                                   std::shared_ptr<db::KvStore> store, LoadSampler sampler,
                                                   scheduling::RetryPolicy::Sleeper sleeper)
    : workloads_(ParseWorkloads(config)),
      interval_(config.tick_interval_ms() > 0 ? std::chrono::milliseconds(config.tick_interval_ms()) : kDefaultInterval),
      window_(config.history_window() > 0 ? config.history_window() : kDefaultWindow),
      up_margin_(config.scale_up_margin() > 0 ? config.scale_up_margin() : kDefaultUpMargin),
      down_margin_(config.scale_down_margin() > 0 ? config.scale_down_margin() : kDefaultDownMargin),
      down_ticks_(config.scale_down_ticks() > 0 ? config.scale_down_ticks() : kDefaultDownTicks),
      forecaster_(MakeForecaster(config)),
      retry_(scheduling::RetryOptions::FromConfig(config.retry()), std::move(sleeper)),
      autoscaler_(std::move(autoscaler)),
      monitoring_(std::move(monitoring)),
      history_(store, config.max_signal_samples()),
      decisions_(store),
      sampler_(std::move(sampler)) {
  if (down_margin_ >= 1.0) {
    throw util::ValidationError("predictive_scaling.scale_down_margin must be below 1");
  }
}

PredictiveScalingService::~PredictiveScalingService() {
  Close();
}

void PredictiveScalingService::Start() {
  std::lock_guard lock(mutex_);
  if (state_ == State::kRunning) {
    COORDINATOR_LOG_INFO("predictive scaling already running");
    return;
  }

  task_ = std::make_unique<scheduling::PeriodicTask>("predictive-scaling", interval_, [this] { Tick(); });
  task_->Start();
  state_ = State::kRunning;

  COORDINATOR_LOG_INFO("predictive scaling started",
                       {observability::IntField("workloads", static_cast<int64_t>(workloads_.size())),
                        observability::IntField("interval_ms", interval_.count()), observability::StringField("forecaster", forecaster_->Name())});
}

void PredictiveScalingService::Close() {
  std::unique_ptr<scheduling::PeriodicTask> task;
  {
    std::lock_guard lock(mutex_);
    if (state_ == State::kStopped) {
      COORDINATOR_LOG_DEBUG("predictive scaling already stopped");
      return;
    }
    task   = std::move(task_);
    state_ = State::kStopped;
  }

  // the tick in progress finishes first
  task->Stop();
  COORDINATOR_LOG_INFO("predictive scaling stopped");
}

PredictiveScalingService::State PredictiveScalingService::CurrentState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void PredictiveScalingService::SetListener(std::shared_ptr<ScalingListener> listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void PredictiveScalingService::RecordSignal(coordinator::v1::ScalingSignal signal) {
  if (signal.workload().empty()) {
    throw util::ValidationError("scaling signal requires a workload");
  }
  if (!std::isfinite(signal.value()) || signal.value() < 0) {
    throw util::ValidationError("scaling signal value must be a non-negative number");
  }
  if (signal.timestamp_ms() == 0) signal.set_timestamp_ms(util::NowMillis());
  if (signal.metric().empty()) signal.set_metric("external");

  history_.Append(signal);
}

void PredictiveScalingService::Tick() {
  for (const auto& workload : workloads_) {
    observability::LogContext log_context({observability::StringField("workload", workload.name)});
    observability::SpanScope  span("scaling.predictive_tick");
    span.SetAttribute("scaling.workload", std::string_view(workload.name));
    try {
      TickWorkload(workload);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      COORDINATOR_LOG_WARN("predictive scaling skipped workload", {observability::StringField("error", e.what())});
    }
  }
}

void PredictiveScalingService::TickWorkload(const WatchedWorkload& workload) {
  coordinator::v1::ScalingSignal sample;
  sample.set_workload(workload.name);
  sample.set_metric("active_workflows");
  sample.set_value(sampler_ ? sampler_(workload.workflow_type) : 0.0);
  sample.set_timestamp_ms(util::NowMillis());
  history_.Append(sample);

  std::vector<double> values;
  for (const auto& signal : history_.Recent(workload.name, std::max(window_, forecaster_->MinSamples()))) {
    values.push_back(signal.value());
  }
  const double forecast = forecaster_->Forecast(values);

  cluster::ScaleStatus status;
  try {
    status = retry_.Execute("get scale", [&] { return autoscaler_->GetScale(workload.name); });
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_ERROR("autoscaler unavailable, no action this tick", {observability::StringField("error", e.what())});
    if (monitoring_) monitoring_->RecordScalingError(workload.name, coordinator::v1::SCALING_SOURCE_PREDICTIVE);
    return;
  }

  const uint32_t pending   = status.desired_replicas > status.current_replicas ? status.desired_replicas - status.current_replicas : 0;
  const uint32_t effective = status.current_replicas + pending;
  const double   capacity  = static_cast<double>(effective) * workload.capacity_per_replica;
  const uint32_t wanted    = workload.Clamp(std::ceil(forecast / workload.capacity_per_replica));

  COORDINATOR_LOG_DEBUG("predictive scaling evaluated",
                        {observability::DoubleField("forecast", forecast),
                         observability::DoubleField("capacity", capacity), observability::IntField("replicas", effective)});

  if (forecast > capacity * (1.0 + up_margin_)) {
    {
      std::lock_guard lock(mutex_);
      below_streak_[workload.name] = 0;
    }
    if (wanted > effective) {
      Apply(workload, coordinator::v1::SCALING_DIRECTION_UP, forecast, capacity, effective, wanted);
    }
    return;
  }

  if (forecast < capacity * (1.0 - down_margin_)) {
    bool due = false;
    {
      std::lock_guard lock(mutex_);
      auto& streak = below_streak_[workload.name];
      if (++streak >= down_ticks_) {
        streak = 0;
        due    = true;
      }
    }
    if (due && wanted < effective) {
      Apply(workload, coordinator::v1::SCALING_DIRECTION_DOWN, forecast, capacity, effective, wanted);
    }
    return;
  }

  std::lock_guard lock(mutex_);
  below_streak_[workload.name] = 0;
}

void PredictiveScalingService::Apply(const WatchedWorkload& workload, coordinator::v1::ScalingDirection direction, double forecast,
                                     double capacity, uint32_t before, uint32_t after) {
  try {
    retry_.Execute("set desired replicas", [&] { autoscaler_->SetDesiredReplicas(workload.name, after); });
  } catch (const util::TransientInfraError& e) {
    COORDINATOR_LOG_ERROR("scaling directive failed",
                          {observability::IntField("replicas", after), observability::StringField("error", e.what())});
    if (monitoring_) monitoring_->RecordScalingError(workload.name, coordinator::v1::SCALING_SOURCE_PREDICTIVE);
    return;
  }

  coordinator::v1::ScalingDecision decision;
  decision.set_workload(workload.name);
  decision.set_direction(direction);
  decision.set_source(coordinator::v1::SCALING_SOURCE_PREDICTIVE);
  decision.set_forecast(forecast);
  decision.set_capacity(capacity);
  decision.set_replicas_before(before);
  decision.set_replicas_after(after);
  decision.set_timestamp_ms(util::NowMillis());
  decision.set_trigger(std::string(forecaster_->Name()));

  COORDINATOR_LOG_INFO("scaling directive issued",
                       {observability::StringField("direction", model::ToString(direction)),
                        observability::DoubleField("forecast", forecast), observability::DoubleField("capacity", capacity),
                        observability::IntField("replicas_before", before), observability::IntField("replicas_after", after)});

  decisions_.Append(decision);
  if (monitoring_) monitoring_->RecordScalingDecision(decision);

  std::shared_ptr<ScalingListener> listener;
  {
    std::lock_guard lock(mutex_);
    listener = listener_;
  }
  if (listener) listener->OnScalingEvent(workload.name, before, after);
}

} // namespace coordinator::scaling
