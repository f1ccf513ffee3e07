#include "hpa_event_logger.hpp"

#include "internal/cluster/autoscaling_api.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/model/names.hpp"
#include "internal/monitoring/monitoring_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/periodic_task.hpp"
#include "internal/util/time.hpp"

namespace coordinator::scaling {

namespace {
constexpr std::chrono::milliseconds kDefaultCheckInterval{30000};
constexpr std::chrono::milliseconds kDefaultMinEventInterval{5 * 60 * 1000};
constexpr std::size_t               kMaxEvents = 1000;
} // namespace

HpaEventLogger::HpaEventLogger(const coordinator::runtime::config::HpaEventLoggingConfig& config, std::vector<std::string> workloads,
                               std::shared_ptr<cluster::AutoscalingApi> autoscaler, std::shared_ptr<monitoring::MonitoringService> monitoring,
                               std::shared_ptr<db::KvStore> store, ClockFn clock)
    : workloads_(std::move(workloads)),
      interval_(config.check_interval_ms() > 0 ? std::chrono::milliseconds(config.check_interval_ms()) : kDefaultCheckInterval),
      min_event_interval_(config.min_event_interval_ms() > 0 ? std::chrono::milliseconds(config.min_event_interval_ms()) : kDefaultMinEventInterval),
      autoscaler_(std::move(autoscaler)),
      monitoring_(std::move(monitoring)),
      store_(std::move(store)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return SteadyClock::now(); };
  }
}

HpaEventLogger::~HpaEventLogger() {
  Stop();
}

void HpaEventLogger::Start() {
  std::lock_guard lock(mutex_);
  if (task_) return;
  task_ = std::make_unique<scheduling::PeriodicTask>("hpa-event-logger", interval_, [this] { Check(); });
  task_->Start();
}

void HpaEventLogger::Stop() {
  std::unique_ptr<scheduling::PeriodicTask> task;
  {
    std::lock_guard lock(mutex_);
    task = std::move(task_);
  }
  if (task) task->Stop();
}

std::string HpaEventLogger::Key(const std::string& workload) {
  return "hpa:events:" + workload;
}

coordinator::v1::HpaEventType HpaEventLogger::Classify(const cluster::ScaleStatus& status) {
  if (status.desired_replicas > status.current_replicas) {
    if (status.max_replicas > 0 && status.desired_replicas >= status.max_replicas) {
      return coordinator::v1::HPA_EVENT_TYPE_LIMITED_SCALE;
    }
    return coordinator::v1::HPA_EVENT_TYPE_SCALE_UP;
  }
  if (status.desired_replicas < status.current_replicas) {
    return coordinator::v1::HPA_EVENT_TYPE_SCALE_DOWN;
  }
  return coordinator::v1::HPA_EVENT_TYPE_NO_SCALE;
}

void HpaEventLogger::Check() {
  for (const auto& workload : workloads_) {
    std::optional<coordinator::v1::HpaEvent> event;
    try {
      event = Observe(workload);
    } catch (const std::exception& e) {
      COORDINATOR_LOG_WARN("failed to read autoscaler state", {observability::StringField("workload", workload), observability::StringField("error", e.what())});
      continue;
    }
    if (!event) continue;

    COORDINATOR_LOG_INFO("autoscaler event",
                         {observability::StringField("workload", workload), observability::StringField("event", model::ToString(event->type())),
                          observability::IntField("current_replicas", event->current_replicas()),
                          observability::IntField("desired_replicas", event->desired_replicas()),
                          observability::StringField("trigger_metric", event->trigger_metric()),
                          observability::DoubleField("trigger_value", event->trigger_value()),
                          observability::DoubleField("trigger_threshold", event->trigger_threshold())});

    if (monitoring_) monitoring_->RecordHpaEvent(*event);
    if (store_) {
      const auto res = store_->Append(Key(workload), event->SerializeAsString(), kMaxEvents);
      if (!res) {
        COORDINATOR_LOG_WARN("failed to persist autoscaler event", {observability::StringField("workload", workload), observability::StringField("error", res.message)});
      }
    }
  }
}

std::optional<coordinator::v1::HpaEvent> HpaEventLogger::Observe(const std::string& workload) {
  const auto status = autoscaler_->GetScale(workload);
  const auto type   = Classify(status);
  if (type == coordinator::v1::HPA_EVENT_TYPE_NO_SCALE) return std::nullopt;

  const auto now = clock_();
  {
    std::lock_guard lock(mutex_);
    auto it = last_event_.find(workload);
    if (it != last_event_.end() && now - it->second < min_event_interval_) return std::nullopt;
    last_event_[workload] = now;
  }

  coordinator::v1::HpaEvent event;
  event.set_workload(workload);
  event.set_type(type);
  event.set_current_replicas(status.current_replicas);
  event.set_desired_replicas(status.desired_replicas);
  event.set_min_replicas(status.min_replicas);
  event.set_max_replicas(status.max_replicas);
  event.set_trigger_metric(status.trigger_metric);
  event.set_trigger_value(status.trigger_value);
  event.set_trigger_threshold(status.trigger_threshold);
  event.set_timestamp_ms(util::NowMillis());
  return event;
}

} // namespace coordinator::scaling
