#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

#include "config/config.pb.h"
#include "coordinator/admin/v1/stats.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/core/v1/workflow.pb.h"
#include "coordinator/scaling/v1/scaling.pb.h"
#include "internal/scheduling/task_queue.hpp"

namespace prometheus {
class Exposer;
}
namespace coordinator::db {
class KvStore;
}

namespace coordinator::monitoring {

/*
  Workflow lifecycle, cache, resource and scaling metrics.

  Record* calls never throw and never block: they enqueue an event that a
  single flush thread applies to the Prometheus registry and to the
  in-process stats. When the queue is full the event is dropped and
  coordinator_monitoring_dropped_events_total goes up.

  At most kMaxWorkflowTypes distinct workflow types get their own stats
  and label values; later types are folded into kOverflowType.
*/
class MonitoringService {
 public:
  using Seconds = std::chrono::duration<double>;

  static constexpr std::size_t kMaxWorkflowTypes = 256;
  // not a valid workflow type name, so it cannot collide with one
  static constexpr const char* kOverflowType = "_other";

  explicit MonitoringService(const coordinator::runtime::config::ObservabilityConfig& config, std::shared_ptr<db::KvStore> store = nullptr);
  ~MonitoringService();

  MonitoringService(const MonitoringService&)            = delete;
  MonitoringService& operator=(const MonitoringService&) = delete;

  void RecordWorkflowCreation(const std::string& type, Seconds elapsed) noexcept;
  void RecordWorkflowCompletion(const std::string& type, bool success, Seconds duration) noexcept;
  void RecordWorkflowCancellation(const std::string& type) noexcept;
  void RecordWorkflowError(const std::string& type, const std::string& message) noexcept;
  void RecordQualityLevel(const std::string& type, coordinator::v1::QualityLevel level) noexcept;
  void RecordResourceAllocation(const coordinator::v1::ResourceAllocation& allocation) noexcept;
  void RecordCacheResult(const std::string& type, bool hit) noexcept;
  void RecordWorkflowMetrics(const coordinator::v1::WorkflowMetrics& metrics) noexcept;
  void RecordScalingDecision(const coordinator::v1::ScalingDecision& decision) noexcept;
  void RecordScalingError(const std::string& workload, coordinator::v1::ScalingSource source) noexcept;
  void RecordHpaEvent(const coordinator::v1::HpaEvent& event) noexcept;

  // Blocks until everything enqueued before the call has been applied.
  void Flush();

  // Drains the queue and joins the flush thread. Later records are dropped.
  void Stop();

  // Prometheus text exposition of the whole registry.
  std::string Scrape() const;

  coordinator::v1::StatsResponse GetStats() const;

  std::shared_ptr<prometheus::Registry> Registry() const {
    return registry_;
  }

  static std::string CategorizeError(std::string_view message);

 private:
  struct Creation {
    std::string type;
    double      seconds;
  };
  struct Completion {
    std::string type;
    bool        success;
    double      seconds;
  };
  struct Cancellation {
    std::string type;
  };
  struct Error {
    std::string type;
    std::string category;
  };
  struct QualityChoice {
    std::string type;
    std::string level;
  };
  struct Allocation {
    std::string pool;
    std::string priority_class;
  };
  struct CacheResult {
    std::string type;
    bool        hit;
  };
  struct Usage {
    double cpu;
    double memory;
    double gpu;
  };
  struct ScalingError {
    std::string workload;
    std::string source;
  };

  using Event = std::variant<Creation, Completion, Cancellation, Error, QualityChoice, Allocation, CacheResult, coordinator::v1::WorkflowMetrics, coordinator::v1::ScalingDecision, ScalingError, coordinator::v1::HpaEvent>;

  struct TypeStats {
    uint64_t           created      = 0;
    uint64_t           completed    = 0;
    uint64_t           failed       = 0;
    uint64_t           cancelled    = 0;
    uint64_t           errors       = 0;
    uint64_t           cache_hits   = 0;
    uint64_t           cache_misses = 0;
    int64_t            active       = 0;
    std::deque<double> creation_seconds;
    std::deque<double> processing_seconds;
  };

  template <typename Make>
  void Record(Make&& make) noexcept {
    try {
      Enqueue(make());
    } catch (const std::exception& e) {
      OnRecordFailure(e);
    }
  }

  void Enqueue(Event event);
  void OnRecordFailure(const std::exception& e) noexcept;
  void               DecrementActive(const std::string& type);
  const std::string& TypeKey(const std::string& type);
  void Loop();
  void Apply(const Event& event);

  void ApplyEvent(const Creation& e);
  void ApplyEvent(const Completion& e);
  void ApplyEvent(const Cancellation& e);
  void ApplyEvent(const Error& e);
  void ApplyEvent(const QualityChoice& e);
  void ApplyEvent(const Allocation& e);
  void ApplyEvent(const CacheResult& e);
  void ApplyUsage(const Usage& e);
  void ApplyEvent(const coordinator::v1::WorkflowMetrics& e);
  void ApplyEvent(const coordinator::v1::ScalingDecision& e);
  void ApplyEvent(const ScalingError& e);
  void ApplyEvent(const coordinator::v1::HpaEvent& e);

  static coordinator::v1::WorkflowTypeStats Summarize(const TypeStats& stats);

  std::shared_ptr<prometheus::Registry> registry_;
  std::shared_ptr<db::KvStore>          store_;

  prometheus::Family<prometheus::Counter>&   created_family_;
  prometheus::Family<prometheus::Histogram>& creation_seconds_family_;
  prometheus::Family<prometheus::Counter>&   completed_family_;
  prometheus::Family<prometheus::Histogram>& duration_family_;
  prometheus::Family<prometheus::Counter>&   cancelled_family_;
  prometheus::Family<prometheus::Counter>&   errors_family_;
  prometheus::Family<prometheus::Counter>&   quality_family_;
  prometheus::Family<prometheus::Counter>&   allocations_family_;
  prometheus::Family<prometheus::Counter>&   cache_family_;
  prometheus::Family<prometheus::Histogram>& stage_family_;
  prometheus::Family<prometheus::Gauge>&     usage_family_;
  prometheus::Family<prometheus::Gauge>&     active_family_;
  prometheus::Family<prometheus::Counter>&   directives_family_;
  prometheus::Family<prometheus::Counter>&   scaling_errors_family_;
  prometheus::Family<prometheus::Gauge>&     forecast_family_;
  prometheus::Family<prometheus::Counter>&   hpa_events_family_;
  prometheus::Counter&                       dropped_;

  std::unique_ptr<prometheus::Exposer> exposer_;

  scheduling::TaskQueue<Event> queue_;
  std::thread                  flush_thread_;
  std::atomic<bool>            running_{true};

  std::mutex              progress_mutex_;
  std::condition_variable progress_cv_;
  std::atomic<uint64_t>   enqueued_{0};
  uint64_t                applied_ = 0;

  // flush thread only
  std::set<std::string> known_types_;
  const std::string     overflow_type_{kOverflowType};

  mutable std::mutex                    stats_mutex_;
  std::map<std::string, TypeStats>      by_type_;
  std::map<std::string, uint64_t>       errors_by_category_;
};

} // namespace coordinator::monitoring
