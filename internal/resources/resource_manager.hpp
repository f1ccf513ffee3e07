#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/core/v1/workflow.pb.h"

namespace coordinator::cluster {
class ClusterApi;
}

namespace coordinator::resources {

struct ResourceProfile {
  int64_t  cpu_millis   = 0;
  int64_t  memory_bytes = 0;
  uint32_t gpu          = 0;
};

/*
  Base CPU/memory/GPU tuple per quality level. Defaults are
  low 500m/2Gi/0, medium 2000m/8Gi/1, high 4000m/16Gi/2; any field set in
  config replaces the default.
*/
struct ResourceTable {
  ResourceProfile low{500, 2LL << 30, 0};
  ResourceProfile medium{2000, 8LL << 30, 1};
  ResourceProfile high{4000, 16LL << 30, 2};

  static ResourceTable FromConfig(const coordinator::runtime::config::ResourcesConfig& config);

  const ResourceProfile& For(coordinator::v1::QualityLevel level) const;
};

/*
  Turns (quality level, priority, subscription tier) into a concrete
  allocation and keeps a short-lived cache of cluster utilization.

  Utilization is refreshed at most once per cache window and by one
  caller at a time; everybody else reads the previous snapshot. Callers
  must tolerate stale numbers.
*/
class ResourceManager {
 public:
  using SteadyClock = std::chrono::steady_clock;
  using ClockFn     = std::function<SteadyClock::time_point()>;

  ResourceManager(const coordinator::runtime::config::ResourcesConfig& config, std::shared_ptr<cluster::ClusterApi> cluster,
                  ClockFn clock = {});

  coordinator::v1::ResourceAllocation AllocateResources(coordinator::v1::QualityLevel level, coordinator::v1::Priority priority,
                                                        coordinator::v1::SubscriptionTier tier);

  // Fails closed for unknown tiers.
  bool ValidateQualityForSubscription(coordinator::v1::QualityLevel level, coordinator::v1::SubscriptionTier tier) const;

  // Throws util::QuotaError when the allocation is outside what the tier may use.
  void ValidateAllocation(const coordinator::v1::ResourceAllocation& allocation, coordinator::v1::SubscriptionTier tier) const;

  coordinator::v1::ResourceUtilization      GetResourceUtilization();
  std::vector<coordinator::v1::NodeMetrics> GetNodeMetrics();

  bool IsUnderHighLoad();

 private:
  struct Snapshot {
    coordinator::v1::ResourceUtilization      utilization;
    std::vector<coordinator::v1::NodeMetrics> nodes;
  };

  void     RefreshIfStale();
  Snapshot CurrentSnapshot() const;

  static coordinator::v1::ResourceUtilization Aggregate(const std::vector<coordinator::v1::NodeMetrics>& nodes);

  ResourceTable                        table_;
  std::chrono::milliseconds            cache_window_;
  double                               high_load_threshold_;
  std::shared_ptr<cluster::ClusterApi> cluster_;
  ClockFn                              clock_;

  mutable std::shared_mutex          snapshot_mutex_;
  std::optional<Snapshot>            snapshot_;
  std::optional<SteadyClock::time_point> refreshed_at_;

  std::mutex refresh_mutex_;
};

} // namespace coordinator::resources
