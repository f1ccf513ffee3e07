#include "monitoring_service.hpp"

#include <prometheus/exposer.h>
#include <prometheus/text_serializer.h>

#include <algorithm>
#include <cctype>

#include "internal/db/api/kv_store.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"

namespace coordinator::monitoring {

namespace {

constexpr std::size_t kDefaultQueueCapacity = 10000;
constexpr std::size_t kStatsWindow          = 100;
constexpr std::size_t kMetricsSeriesLength  = 1000;

const prometheus::Histogram::BucketBoundaries& CreationBuckets() {
  static const prometheus::Histogram::BucketBoundaries buckets{0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
  return buckets;
}

const prometheus::Histogram::BucketBoundaries& DurationBuckets() {
  static const prometheus::Histogram::BucketBoundaries buckets{1, 5, 15, 30, 60, 120, 300, 600, 1800, 3600, 7200};
  return buckets;
}

prometheus::Family<prometheus::Counter>& CounterFamily(prometheus::Registry& registry, const std::string& name, const std::string& help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(registry);
}

prometheus::Family<prometheus::Gauge>& GaugeFamily(prometheus::Registry& registry, const std::string& name, const std::string& help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(registry);
}

prometheus::Family<prometheus::Histogram>& HistogramFamily(prometheus::Registry& registry, const std::string& name, const std::string& help) {
  return prometheus::BuildHistogram().Name(name).Help(help).Register(registry);
}

std::shared_ptr<prometheus::Registry> NewRegistry() {
  return std::make_shared<prometheus::Registry>();
}

void PushBounded(std::deque<double>& window, double value) {
  window.push_back(value);
  while (window.size() > kStatsWindow) window.pop_front();
}

double Mean(const std::deque<double>& window) {
  if (window.empty()) return 0.0;
  double sum = 0.0;
  for (double v : window) sum += v;
  return sum / static_cast<double>(window.size());
}

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

MonitoringService::MonitoringService(const coordinator::runtime::config::ObservabilityConfig& config, std::shared_ptr<db::KvStore> store)
    : registry_(NewRegistry()),
      store_(std::move(store)),
      created_family_(CounterFamily(*registry_, "coordinator_workflows_created_total", "Workflows submitted to the execution engine")),
      creation_seconds_family_(HistogramFamily(*registry_, "coordinator_workflow_creation_seconds", "Time spent creating a workflow")),
      completed_family_(CounterFamily(*registry_, "coordinator_workflows_completed_total", "Workflows that reached a terminal state")),
      duration_family_(HistogramFamily(*registry_, "coordinator_workflow_duration_seconds", "Workflow run time from creation to terminal state")),
      cancelled_family_(CounterFamily(*registry_, "coordinator_workflows_cancelled_total", "Workflows cancelled by a caller")),
      errors_family_(CounterFamily(*registry_, "coordinator_workflow_errors_total", "Workflow errors by category")),
      quality_family_(CounterFamily(*registry_, "coordinator_quality_levels_total", "Resolved quality levels")),
      allocations_family_(CounterFamily(*registry_, "coordinator_resource_allocations_total", "Resource allocations by node pool and priority class")),
      cache_family_(CounterFamily(*registry_, "coordinator_cache_requests_total", "Cache lookups by result")),
      stage_family_(HistogramFamily(*registry_, "coordinator_workflow_stage_duration_seconds", "Processing stage durations")),
      usage_family_(GaugeFamily(*registry_, "coordinator_resource_usage_ratio", "Cluster resource utilization")),
      active_family_(GaugeFamily(*registry_, "coordinator_active_workflows", "Workflows not yet terminal")),
      directives_family_(CounterFamily(*registry_, "coordinator_scaling_directives_total", "Replica directives issued to the autoscaler")),
      scaling_errors_family_(CounterFamily(*registry_, "coordinator_scaling_errors_total", "Replica directives that failed after retries")),
      forecast_family_(GaugeFamily(*registry_, "coordinator_scaling_forecast", "Latest load forecast per workload")),
      hpa_events_family_(CounterFamily(*registry_, "coordinator_hpa_events_total", "Observed autoscaler events")),
      dropped_(CounterFamily(*registry_, "coordinator_monitoring_dropped_events_total", "Monitoring events dropped because the queue was full").Add({})),
      queue_(config.event_queue_capacity() > 0 ? config.event_queue_capacity() : kDefaultQueueCapacity) {
  if (!config.metrics_bind_address().empty()) {
    exposer_ = std::make_unique<prometheus::Exposer>(config.metrics_bind_address());
    exposer_->RegisterCollectable(registry_);
    COORDINATOR_LOG_INFO("metrics endpoint listening", {observability::StringField("address", config.metrics_bind_address())});
  }

  flush_thread_ = std::thread([this] { Loop(); });
}

MonitoringService::~MonitoringService() {
  Stop();
}

void MonitoringService::Stop() {
  if (!running_.exchange(false)) return;

  queue_.Shutdown();
  if (flush_thread_.joinable()) flush_thread_.join();

  std::lock_guard lock(progress_mutex_);
  progress_cv_.notify_all();
}

// ------------------------------------------------------------
// Record API
// ------------------------------------------------------------

void MonitoringService::Enqueue(Event event) {
  if (queue_.TryEnqueue(std::move(event))) {
    enqueued_.fetch_add(1);
  } else {
    dropped_.Increment();
  }
}

void MonitoringService::OnRecordFailure(const std::exception& e) noexcept {
  dropped_.Increment();
  COORDINATOR_LOG_WARN("monitoring event dropped", {observability::StringField("error", e.what())});
}

void MonitoringService::RecordWorkflowCreation(const std::string& type, Seconds elapsed) noexcept {
  Record([&] { return Creation{type, elapsed.count()}; });
}

void MonitoringService::RecordWorkflowCompletion(const std::string& type, bool success, Seconds duration) noexcept {
  Record([&] { return Completion{type, success, duration.count()}; });
}

void MonitoringService::RecordWorkflowCancellation(const std::string& type) noexcept {
  Record([&] { return Cancellation{type}; });
}

void MonitoringService::RecordWorkflowError(const std::string& type, const std::string& message) noexcept {
  Record([&] { return Error{type, CategorizeError(message)}; });
}

void MonitoringService::RecordQualityLevel(const std::string& type, coordinator::v1::QualityLevel level) noexcept {
  Record([&] { return QualityChoice{type, std::string(model::ToString(level))}; });
}

void MonitoringService::RecordResourceAllocation(const coordinator::v1::ResourceAllocation& allocation) noexcept {
  Record([&] { return Allocation{std::string(model::ToString(allocation.node_pool())), allocation.priority_class()}; });
}

void MonitoringService::RecordCacheResult(const std::string& type, bool hit) noexcept {
  Record([&] { return CacheResult{type, hit}; });
}

void MonitoringService::RecordWorkflowMetrics(const coordinator::v1::WorkflowMetrics& metrics) noexcept {
  Record([&] { return Event(metrics); });
}

void MonitoringService::RecordScalingDecision(const coordinator::v1::ScalingDecision& decision) noexcept {
  Record([&] { return Event(decision); });
}

void MonitoringService::RecordScalingError(const std::string& workload, coordinator::v1::ScalingSource source) noexcept {
  Record([&] { return ScalingError{workload, std::string(model::ToString(source))}; });
}

void MonitoringService::RecordHpaEvent(const coordinator::v1::HpaEvent& event) noexcept {
  Record([&] { return Event(event); });
}

void MonitoringService::Flush() {
  const auto       target = enqueued_.load();
  std::unique_lock lock(progress_mutex_);
  progress_cv_.wait(lock, [&] { return applied_ >= target || !running_.load(); });
}

// ------------------------------------------------------------
// Flush thread
// ------------------------------------------------------------

void MonitoringService::Loop() {
  while (auto event = queue_.Dequeue()) {
    try {
      Apply(*event);
    } catch (const std::exception& e) {
      COORDINATOR_LOG_WARN("failed to apply monitoring event", {observability::StringField("error", e.what())});
    }

    std::lock_guard lock(progress_mutex_);
    ++applied_;
    progress_cv_.notify_all();
  }
}

void MonitoringService::Apply(const Event& event) {
  std::visit([this](const auto& e) { ApplyEvent(e); }, event);
}

const std::string& MonitoringService::TypeKey(const std::string& type) {
  auto it = known_types_.find(type);
  if (it != known_types_.end()) return *it;
  if (known_types_.size() < kMaxWorkflowTypes) return *known_types_.insert(type).first;

  if (known_types_.size() == kMaxWorkflowTypes) {
    // logged once; the sentinel entry marks that folding has started
    known_types_.insert(overflow_type_);
    COORDINATOR_LOG_WARN("workflow type limit reached, folding new types",
                         {observability::StringField("type", type), observability::IntField("limit", static_cast<int64_t>(kMaxWorkflowTypes))});
  }
  return overflow_type_;
}

void MonitoringService::ApplyEvent(const Creation& e) {
  const auto& type = TypeKey(e.type);
  created_family_.Add({{"type", type}}).Increment();
  creation_seconds_family_.Add({{"type", type}}, CreationBuckets()).Observe(e.seconds);
  active_family_.Add({{"type", type}}).Increment();

  std::lock_guard lock(stats_mutex_);
  auto& stats = by_type_[type];
  ++stats.created;
  ++stats.active;
  PushBounded(stats.creation_seconds, e.seconds);
}

void MonitoringService::ApplyEvent(const Completion& e) {
  const auto& type = TypeKey(e.type);
  const std::string success = e.success ? "true" : "false";
  completed_family_.Add({{"type", type}, {"success", success}}).Increment();
  duration_family_.Add({{"type", type}, {"success", success}}, DurationBuckets()).Observe(e.seconds);
  DecrementActive(type);

  std::lock_guard lock(stats_mutex_);
  auto& stats = by_type_[type];
  if (e.success) {
    ++stats.completed;
  } else {
    ++stats.failed;
  }
  if (stats.active > 0) --stats.active;
  PushBounded(stats.processing_seconds, e.seconds);
}

void MonitoringService::ApplyEvent(const Cancellation& e) {
  const auto& type = TypeKey(e.type);
  cancelled_family_.Add({{"type", type}}).Increment();
  DecrementActive(type);

  std::lock_guard lock(stats_mutex_);
  auto& stats = by_type_[type];
  ++stats.cancelled;
  if (stats.active > 0) --stats.active;
}

// workflows rehydrated after a restart finish without a matching creation
void MonitoringService::DecrementActive(const std::string& type) {
  auto& gauge = active_family_.Add({{"type", type}});
  if (gauge.Value() > 0) gauge.Decrement();
}

void MonitoringService::ApplyEvent(const Error& e) {
  const auto& type = TypeKey(e.type);
  errors_family_.Add({{"type", type}, {"category", e.category}}).Increment();

  std::lock_guard lock(stats_mutex_);
  ++by_type_[type].errors;
  ++errors_by_category_[e.category];
}

void MonitoringService::ApplyEvent(const QualityChoice& e) {
  const auto& type = TypeKey(e.type);
  quality_family_.Add({{"type", type}, {"level", e.level}}).Increment();
}

void MonitoringService::ApplyEvent(const Allocation& e) {
  allocations_family_.Add({{"pool", e.pool}, {"priority_class", e.priority_class}}).Increment();
}

void MonitoringService::ApplyEvent(const CacheResult& e) {
  const auto& type = TypeKey(e.type);
  cache_family_.Add({{"type", type}, {"result", e.hit ? "hit" : "miss"}}).Increment();

  std::lock_guard lock(stats_mutex_);
  auto& stats = by_type_[type];
  if (e.hit) {
    ++stats.cache_hits;
  } else {
    ++stats.cache_misses;
  }
}

void MonitoringService::ApplyUsage(const Usage& e) {
  usage_family_.Add({{"resource", "cpu"}}).Set(e.cpu);
  usage_family_.Add({{"resource", "memory"}}).Set(e.memory);
  usage_family_.Add({{"resource", "gpu"}}).Set(e.gpu);
}

void MonitoringService::ApplyEvent(const coordinator::v1::WorkflowMetrics& e) {
  const auto& type = TypeKey(e.type());
  for (const auto& [stage, seconds] : e.stage_durations_seconds()) {
    stage_family_.Add({{"type", type}, {"stage", stage}}, DurationBuckets()).Observe(seconds);
  }
  if (e.has_utilization()) {
    ApplyUsage(Usage{e.utilization().cpu(), e.utilization().memory(), e.utilization().gpu()});
  }

  if (!store_) return;
  const auto res = store_->Append("metrics:workflow:" + e.type(), e.SerializeAsString(), kMetricsSeriesLength);
  if (!res) {
    COORDINATOR_LOG_WARN("failed to persist workflow metrics",
                         {observability::StringField("workflow_id", e.workflow_id()), observability::StringField("error", res.message)});
  }
}

void MonitoringService::ApplyEvent(const coordinator::v1::ScalingDecision& e) {
  directives_family_
      .Add({{"workload", e.workload()}, {"direction", std::string(model::ToString(e.direction()))}, {"source", std::string(model::ToString(e.source()))}})
      .Increment();
  if (e.source() == coordinator::v1::SCALING_SOURCE_PREDICTIVE) {
    forecast_family_.Add({{"workload", e.workload()}}).Set(e.forecast());
  }
}

void MonitoringService::ApplyEvent(const ScalingError& e) {
  scaling_errors_family_.Add({{"workload", e.workload}, {"source", e.source}}).Increment();
}

void MonitoringService::ApplyEvent(const coordinator::v1::HpaEvent& e) {
  hpa_events_family_.Add({{"workload", e.workload()}, {"event", std::string(model::ToString(e.type()))}}).Increment();
}

// ------------------------------------------------------------
// Read side
// ------------------------------------------------------------

std::string MonitoringService::Scrape() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

coordinator::v1::WorkflowTypeStats MonitoringService::Summarize(const TypeStats& stats) {
  coordinator::v1::WorkflowTypeStats out;
  out.set_created(stats.created);
  out.set_completed(stats.completed);
  out.set_failed(stats.failed);
  out.set_cancelled(stats.cancelled);
  out.set_errors(stats.errors);
  out.set_cache_hits(stats.cache_hits);
  out.set_cache_misses(stats.cache_misses);
  out.set_active(stats.active);
  out.set_avg_creation_seconds(Mean(stats.creation_seconds));
  out.set_avg_processing_seconds(Mean(stats.processing_seconds));

  const auto lookups = stats.cache_hits + stats.cache_misses;
  out.set_cache_hit_rate(lookups > 0 ? static_cast<double>(stats.cache_hits) / static_cast<double>(lookups) : 0.0);
  out.set_error_rate(stats.created > 0 ? static_cast<double>(stats.errors) / static_cast<double>(stats.created) : 0.0);
  return out;
}

coordinator::v1::StatsResponse MonitoringService::GetStats() const {
  coordinator::v1::StatsResponse response;

  std::lock_guard lock(stats_mutex_);

  TypeStats total;
  for (const auto& [type, stats] : by_type_) {
    (*response.mutable_by_type())[type] = Summarize(stats);

    total.created += stats.created;
    total.completed += stats.completed;
    total.failed += stats.failed;
    total.cancelled += stats.cancelled;
    total.errors += stats.errors;
    total.cache_hits += stats.cache_hits;
    total.cache_misses += stats.cache_misses;
    total.active += stats.active;
    for (double v : stats.creation_seconds) total.creation_seconds.push_back(v);
    for (double v : stats.processing_seconds) total.processing_seconds.push_back(v);
  }
  *response.mutable_total() = Summarize(total);

  for (const auto& [category, count] : errors_by_category_) {
    (*response.mutable_errors_by_category())[category] = count;
  }
  response.set_dropped_events(static_cast<uint64_t>(dropped_.Value()));
  return response;
}

std::string MonitoringService::CategorizeError(std::string_view message) {
  std::string lower(message);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (Contains(lower, "timeout") || Contains(lower, "timed out")) return "timeout";
  if (Contains(lower, "resource") && (Contains(lower, "unavailable") || Contains(lower, "exceeded"))) return "resource_limit";
  if (Contains(lower, "permission") || Contains(lower, "unauthorized") || Contains(lower, "forbidden")) return "permission";
  if (Contains(lower, "not found")) return "not_found";
  if (Contains(lower, "invalid") || Contains(lower, "validation")) return "validation";
  return "unknown";
}

} // namespace coordinator::monitoring
