#include "tier_policy.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace coordinator::resources {

namespace {

constexpr int32_t kDefaultPriorityValue = 10;

constexpr std::array<std::string_view, 3> kInteractiveTypes = {"preview", "quick-analysis", "real-time"};

int Rank(QualityLevel level) {
  switch (level) {
    case coordinator::v1::QUALITY_LEVEL_LOW:
      return 1;
    case coordinator::v1::QUALITY_LEVEL_MEDIUM:
      return 2;
    case coordinator::v1::QUALITY_LEVEL_HIGH:
      return 3;
    default:
      return 0;
  }
}

} // namespace

QualityLevel GetHighestAllowedQuality(SubscriptionTier tier) {
  switch (tier) {
    case coordinator::v1::SUBSCRIPTION_TIER_PREMIUM:
      return coordinator::v1::QUALITY_LEVEL_HIGH;
    case coordinator::v1::SUBSCRIPTION_TIER_STANDARD:
      return coordinator::v1::QUALITY_LEVEL_MEDIUM;
    default:
      return coordinator::v1::QUALITY_LEVEL_LOW;
  }
}

bool IsQualityAllowed(QualityLevel level, SubscriptionTier tier) {
  return Rank(level) > 0 && Rank(level) <= Rank(GetHighestAllowedQuality(tier));
}

QualityLevel ClampToTier(QualityLevel level, SubscriptionTier tier) {
  if (Rank(level) == 0) return coordinator::v1::QUALITY_LEVEL_LOW;
  const auto ceiling = GetHighestAllowedQuality(tier);
  return Rank(level) > Rank(ceiling) ? ceiling : level;
}

std::vector<NodePool> AllowedNodePools(SubscriptionTier tier) {
  switch (tier) {
    case coordinator::v1::SUBSCRIPTION_TIER_PREMIUM:
      return {coordinator::v1::NODE_POOL_GENERAL, coordinator::v1::NODE_POOL_GPU, coordinator::v1::NODE_POOL_GPU_HIGHEND};
    case coordinator::v1::SUBSCRIPTION_TIER_STANDARD:
      return {coordinator::v1::NODE_POOL_GENERAL, coordinator::v1::NODE_POOL_GPU};
    default:
      return {coordinator::v1::NODE_POOL_GENERAL};
  }
}

bool IsNodePoolAllowed(NodePool pool, SubscriptionTier tier) {
  const auto pools = AllowedNodePools(tier);
  return std::find(pools.begin(), pools.end(), pool) != pools.end();
}

NodePool PoolForQuality(QualityLevel level) {
  switch (level) {
    case coordinator::v1::QUALITY_LEVEL_HIGH:
      return coordinator::v1::NODE_POOL_GPU_HIGHEND;
    case coordinator::v1::QUALITY_LEVEL_MEDIUM:
      return coordinator::v1::NODE_POOL_GPU;
    default:
      return coordinator::v1::NODE_POOL_GENERAL;
  }
}

std::map<std::string, std::string> NodeSelectorFor(NodePool pool) {
  switch (pool) {
    case coordinator::v1::NODE_POOL_GPU_HIGHEND:
      return {{"node-type", "gpu-optimized"}, {"gpu-type", "nvidia-a100"}};
    case coordinator::v1::NODE_POOL_GPU:
      return {{"node-type", "gpu-optimized"}, {"gpu-type", "nvidia-t4"}};
    default:
      return {{"node-type", "cpu-optimized"}};
  }
}

std::vector<coordinator::v1::Toleration> TolerationsFor(NodePool pool) {
  if (pool != coordinator::v1::NODE_POOL_GPU && pool != coordinator::v1::NODE_POOL_GPU_HIGHEND) {
    return {};
  }

  coordinator::v1::Toleration toleration;
  toleration.set_key("nvidia.com/gpu");
  toleration.set_operator_("Exists");
  toleration.set_effect("NoSchedule");
  return {toleration};
}

std::string PriorityClassName(Priority priority) {
  switch (priority) {
    case coordinator::v1::PRIORITY_CRITICAL:
      return "system-critical";
    case coordinator::v1::PRIORITY_HIGH:
      return "interactive";
    case coordinator::v1::PRIORITY_LOW:
      return "low-priority-batch";
    case coordinator::v1::PRIORITY_BACKGROUND:
      return "maintenance";
    default:
      return "medium-priority-batch";
  }
}

int32_t GetPriorityValue(QualityLevel level, SubscriptionTier tier) {
  // columns: high, medium, low
  static constexpr std::array<int32_t, 3> kFree     = {10, 0, 0};
  static constexpr std::array<int32_t, 3> kStandard = {30, 20, 0};
  static constexpr std::array<int32_t, 3> kPremium  = {50, 40, 30};

  const std::array<int32_t, 3>* table = &kStandard;
  if (tier == coordinator::v1::SUBSCRIPTION_TIER_FREE) table = &kFree;
  if (tier == coordinator::v1::SUBSCRIPTION_TIER_PREMIUM) table = &kPremium;

  int32_t value = 0;
  switch (level) {
    case coordinator::v1::QUALITY_LEVEL_HIGH:
      value = (*table)[0];
      break;
    case coordinator::v1::QUALITY_LEVEL_MEDIUM:
      value = (*table)[1];
      break;
    case coordinator::v1::QUALITY_LEVEL_LOW:
      value = (*table)[2];
      break;
    default:
      break;
  }
  return value == 0 ? kDefaultPriorityValue : value;
}

Priority DefaultPriority(const coordinator::v1::WorkflowRequest& request) {
  if (request.priority() != coordinator::v1::PRIORITY_UNSPECIFIED) {
    return request.priority();
  }

  if (std::find(kInteractiveTypes.begin(), kInteractiveTypes.end(), request.type()) != kInteractiveTypes.end()) {
    return coordinator::v1::PRIORITY_HIGH;
  }

  switch (request.subscription_tier()) {
    case coordinator::v1::SUBSCRIPTION_TIER_PREMIUM:
      return coordinator::v1::PRIORITY_HIGH;
    case coordinator::v1::SUBSCRIPTION_TIER_STANDARD:
      return coordinator::v1::PRIORITY_MEDIUM;
    default:
      return coordinator::v1::PRIORITY_LOW;
  }
}

} // namespace coordinator::resources
