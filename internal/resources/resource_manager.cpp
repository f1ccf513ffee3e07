#include "resource_manager.hpp"

#include <algorithm>

#include "internal/cluster/cluster_api.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "quantity.hpp"
#include "tier_policy.hpp"

namespace coordinator::resources {

namespace {

constexpr double  kDefaultUtilization       = 0.5;
constexpr double  kDefaultHighLoadThreshold = 0.8;
constexpr int64_t kMinCpuMillis             = 100;
constexpr int64_t kMinMemoryBytes           = 256LL << 20;

ResourceProfile Override(ResourceProfile base, const coordinator::runtime::config::ResourceProfile& config) {
  if (!config.cpu().empty()) base.cpu_millis = ParseCpuMillis(config.cpu());
  if (!config.memory().empty()) base.memory_bytes = ParseMemoryBytes(config.memory());
  if (config.gpu() > 0) base.gpu = config.gpu();
  return base;
}

int64_t Scale(int64_t value, double factor) {
  return static_cast<int64_t>(static_cast<double>(value) * factor);
}

} // namespace

ResourceTable ResourceTable::FromConfig(const coordinator::runtime::config::ResourcesConfig& config) {
  ResourceTable table;
  table.low    = Override(table.low, config.low());
  table.medium = Override(table.medium, config.medium());
  table.high   = Override(table.high, config.high());
  return table;
}

const ResourceProfile& ResourceTable::For(coordinator::v1::QualityLevel level) const {
  switch (level) {
    case coordinator::v1::QUALITY_LEVEL_HIGH:
      return high;
    case coordinator::v1::QUALITY_LEVEL_MEDIUM:
      return medium;
    default:
      return low;
  }
}

ResourceManager::ResourceManager(const coordinator::runtime::config::ResourcesConfig& config, std::shared_ptr<cluster::ClusterApi> cluster,
                                 ClockFn clock)
    : table_(ResourceTable::FromConfig(config)),
      cache_window_(config.utilization_cache_ms() > 0 ? config.utilization_cache_ms() : 5000),
      high_load_threshold_(config.high_load_threshold() > 0 ? config.high_load_threshold() : kDefaultHighLoadThreshold),
      cluster_(std::move(cluster)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return SteadyClock::now(); };
  }
}

coordinator::v1::ResourceAllocation ResourceManager::AllocateResources(coordinator::v1::QualityLevel level, coordinator::v1::Priority priority,
                                                                       coordinator::v1::SubscriptionTier tier) {
  const auto resolved = ClampToTier(level, tier);
  auto       pool     = PoolForQuality(resolved);
  auto       profile  = table_.For(resolved);

  const auto utilization = GetResourceUtilization();
  const bool cpu_loaded  = utilization.cpu() > high_load_threshold_;
  const bool mem_loaded  = utilization.memory() > high_load_threshold_;
  const bool gpu_loaded  = utilization.gpu() > high_load_threshold_;

  if (cpu_loaded || mem_loaded || gpu_loaded) {
    if (tier == coordinator::v1::SUBSCRIPTION_TIER_FREE) {
      profile = table_.low;
      pool    = coordinator::v1::NODE_POOL_GENERAL;
    }

    if (priority == coordinator::v1::PRIORITY_MEDIUM) {
      if (cpu_loaded) profile.cpu_millis = Scale(profile.cpu_millis, 0.75);
      if (mem_loaded) profile.memory_bytes = Scale(profile.memory_bytes, 0.75);
    } else if (priority == coordinator::v1::PRIORITY_LOW || priority == coordinator::v1::PRIORITY_BACKGROUND) {
      if (cpu_loaded) profile.cpu_millis = Scale(profile.cpu_millis, 0.5);
      if (mem_loaded) profile.memory_bytes = Scale(profile.memory_bytes, 0.5);
      if (gpu_loaded && resolved != coordinator::v1::QUALITY_LEVEL_HIGH) {
        profile.gpu = 0;
        pool        = coordinator::v1::NODE_POOL_GENERAL;
      }
    }

    COORDINATOR_LOG_DEBUG("allocation adjusted for cluster load",
                          {observability::StringField("priority", model::ToString(priority)), observability::DoubleField("cpu", utilization.cpu()),
                           observability::DoubleField("memory", utilization.memory()), observability::DoubleField("gpu", utilization.gpu())});
  }

  // the node selector must always be one the tier may use
  if (!IsNodePoolAllowed(pool, tier)) {
    pool = AllowedNodePools(tier).back();
  }
  if (pool == coordinator::v1::NODE_POOL_GENERAL) {
    profile.gpu = 0;
  }

  profile.cpu_millis   = std::max(profile.cpu_millis, kMinCpuMillis);
  profile.memory_bytes = std::max(profile.memory_bytes, kMinMemoryBytes);

  coordinator::v1::ResourceAllocation allocation;
  allocation.set_cpu(FormatCpuMillis(profile.cpu_millis));
  allocation.set_memory(FormatMemoryBytes(profile.memory_bytes));
  allocation.set_gpu(profile.gpu);
  for (const auto& [key, value] : NodeSelectorFor(pool)) {
    (*allocation.mutable_node_selector())[key] = value;
  }
  for (const auto& toleration : TolerationsFor(pool)) {
    *allocation.add_tolerations() = toleration;
  }
  allocation.set_node_pool(pool);
  allocation.set_priority_class(PriorityClassName(priority));
  allocation.set_priority_value(GetPriorityValue(resolved, tier));
  return allocation;
}

bool ResourceManager::ValidateQualityForSubscription(coordinator::v1::QualityLevel level, coordinator::v1::SubscriptionTier tier) const {
  return IsQualityAllowed(level, tier);
}

void ResourceManager::ValidateAllocation(const coordinator::v1::ResourceAllocation& allocation, coordinator::v1::SubscriptionTier tier) const {
  if (!IsNodePoolAllowed(allocation.node_pool(), tier)) {
    throw util::QuotaError("node pool " + std::string(model::ToString(allocation.node_pool())) + " not permitted for tier " +
                               std::string(model::ToString(tier)),
                           std::string(model::ToString(GetHighestAllowedQuality(tier))));
  }
  if (allocation.gpu() > table_.For(GetHighestAllowedQuality(tier)).gpu) {
    throw util::QuotaError("gpu request of " + std::to_string(allocation.gpu()) + " exceeds tier " + std::string(model::ToString(tier)),
                           std::string(model::ToString(GetHighestAllowedQuality(tier))));
  }
}

coordinator::v1::ResourceUtilization ResourceManager::GetResourceUtilization() {
  RefreshIfStale();
  return CurrentSnapshot().utilization;
}

std::vector<coordinator::v1::NodeMetrics> ResourceManager::GetNodeMetrics() {
  RefreshIfStale();
  return CurrentSnapshot().nodes;
}

bool ResourceManager::IsUnderHighLoad() {
  const auto utilization = GetResourceUtilization();
  return utilization.cpu() > high_load_threshold_ || utilization.memory() > high_load_threshold_ || utilization.gpu() > high_load_threshold_;
}

ResourceManager::Snapshot ResourceManager::CurrentSnapshot() const {
  std::shared_lock lock(snapshot_mutex_);
  if (snapshot_) {
    return *snapshot_;
  }

  Snapshot fallback;
  fallback.utilization.set_cpu(kDefaultUtilization);
  fallback.utilization.set_memory(kDefaultUtilization);
  fallback.utilization.set_gpu(kDefaultUtilization);
  return fallback;
}

void ResourceManager::RefreshIfStale() {
  if (!cluster_) return;

  {
    std::shared_lock lock(snapshot_mutex_);
    if (refreshed_at_ && clock_() - *refreshed_at_ < cache_window_) return;
  }

  // single flight: whoever loses the race reads the previous snapshot
  std::unique_lock refresh(refresh_mutex_, std::try_to_lock);
  if (!refresh.owns_lock()) return;

  {
    std::shared_lock lock(snapshot_mutex_);
    if (refreshed_at_ && clock_() - *refreshed_at_ < cache_window_) return;
  }

  std::optional<Snapshot> fresh;
  try {
    Snapshot snapshot;
    snapshot.nodes       = cluster_->ListNodeMetrics();
    snapshot.utilization = Aggregate(snapshot.nodes);
    fresh                = std::move(snapshot);
  } catch (const std::exception& e) {
    COORDINATOR_LOG_WARN("cluster utilization refresh failed, keeping previous snapshot", {observability::StringField("error", e.what())});
  }

  std::unique_lock lock(snapshot_mutex_);
  if (fresh) snapshot_ = std::move(fresh);
  // failed refreshes also wait out the window so the control plane is not hammered
  refreshed_at_ = clock_();
}

coordinator::v1::ResourceUtilization ResourceManager::Aggregate(const std::vector<coordinator::v1::NodeMetrics>& nodes) {
  coordinator::v1::ResourceUtilization utilization;
  utilization.set_observed_at_ms(util::NowMillis());

  if (nodes.empty()) {
    utilization.set_cpu(kDefaultUtilization);
    utilization.set_memory(kDefaultUtilization);
    utilization.set_gpu(kDefaultUtilization);
    return utilization;
  }

  double   cpu = 0.0;
  double   mem = 0.0;
  uint64_t gpu_capacity = 0;
  uint64_t gpu_used     = 0;
  for (const auto& node : nodes) {
    cpu += node.cpu_usage();
    mem += node.memory_usage();
    gpu_capacity += node.gpu_capacity();
    gpu_used += node.gpu_used();
  }

  const auto n = static_cast<double>(nodes.size());
  utilization.set_cpu(cpu / n);
  utilization.set_memory(mem / n);
  utilization.set_gpu(gpu_capacity > 0 ? static_cast<double>(gpu_used) / static_cast<double>(gpu_capacity) : 0.0);
  return utilization;
}

} // namespace coordinator::resources
