#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/resources/quantity.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/resources/tier_policy.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace coordinator::v1;
using coordinator::resources::ResourceManager;

constexpr QualityLevel     kLevels[] = {QUALITY_LEVEL_LOW, QUALITY_LEVEL_MEDIUM, QUALITY_LEVEL_HIGH};
constexpr SubscriptionTier kTiers[]  = {SUBSCRIPTION_TIER_FREE, SUBSCRIPTION_TIER_STANDARD, SUBSCRIPTION_TIER_PREMIUM};
constexpr Priority         kPriorities[] = {PRIORITY_CRITICAL, PRIORITY_HIGH, PRIORITY_MEDIUM, PRIORITY_LOW, PRIORITY_BACKGROUND};

std::shared_ptr<coordinator::testing::FakeCluster> Cluster(double usage) {
  auto cluster = std::make_shared<coordinator::testing::FakeCluster>();
  cluster->SetUsage(usage, usage);
  return cluster;
}

void TestNodeSelectorAlwaysPermittedForTier() {
  for (double usage : {0.1, 0.95}) {
    ResourceManager manager(coordinator::runtime::config::ResourcesConfig{}, Cluster(usage));
    for (auto level : kLevels) {
      for (auto tier : kTiers) {
        for (auto priority : kPriorities) {
          const auto allocation = manager.AllocateResources(level, priority, tier);
          assert(coordinator::resources::IsNodePoolAllowed(allocation.node_pool(), tier));

          const auto expected = coordinator::resources::NodeSelectorFor(allocation.node_pool());
          assert(static_cast<std::size_t>(allocation.node_selector_size()) == expected.size());
          for (const auto& [key, value] : expected) {
            assert(allocation.node_selector().at(key) == value);
          }
          if (allocation.node_pool() == NODE_POOL_GENERAL) {
            assert(allocation.gpu() == 0);
            assert(allocation.tolerations_size() == 0);
          }
          // never throws for what it produced itself
          manager.ValidateAllocation(allocation, tier);
        }
      }
    }
  }
}

void TestIdleClusterAllocatesProfiles() {
  ResourceManager manager(coordinator::runtime::config::ResourcesConfig{}, Cluster(0.1));

  const auto high = manager.AllocateResources(QUALITY_LEVEL_HIGH, PRIORITY_HIGH, SUBSCRIPTION_TIER_PREMIUM);
  assert(high.cpu() == "4000m");
  assert(high.memory() == "16Gi");
  assert(high.gpu() == 2);
  assert(high.node_pool() == NODE_POOL_GPU_HIGHEND);
  assert(high.node_selector().at("gpu-type") == "nvidia-a100");
  assert(high.tolerations_size() == 1);
  assert(high.tolerations(0).key() == "nvidia.com/gpu");
  assert(high.priority_class() == "interactive");
  assert(high.priority_value() == 50);

  // free tier asking for high gets the low profile
  const auto free = manager.AllocateResources(QUALITY_LEVEL_HIGH, PRIORITY_LOW, SUBSCRIPTION_TIER_FREE);
  assert(free.cpu() == "500m");
  assert(free.memory() == "2Gi");
  assert(free.gpu() == 0);
  assert(free.node_selector().at("node-type") == "cpu-optimized");
  assert(free.priority_class() == "low-priority-batch");
}

void TestHighLoadShrinksLowPriorityWork() {
  ResourceManager manager(coordinator::runtime::config::ResourcesConfig{}, Cluster(0.95));
  assert(manager.IsUnderHighLoad());

  const auto low = manager.AllocateResources(QUALITY_LEVEL_MEDIUM, PRIORITY_LOW, SUBSCRIPTION_TIER_PREMIUM);
  assert(low.cpu() == "1000m");
  assert(low.memory() == "4Gi");

  const auto medium = manager.AllocateResources(QUALITY_LEVEL_MEDIUM, PRIORITY_MEDIUM, SUBSCRIPTION_TIER_PREMIUM);
  assert(medium.cpu() == "1500m");
  assert(medium.memory() == "6Gi");

  const auto critical = manager.AllocateResources(QUALITY_LEVEL_MEDIUM, PRIORITY_CRITICAL, SUBSCRIPTION_TIER_PREMIUM);
  assert(critical.cpu() == "2000m");
  assert(critical.memory() == "8Gi");
}

void TestValidateAllocationRejectsPoolAboveTier() {
  ResourceManager manager(coordinator::runtime::config::ResourcesConfig{}, Cluster(0.1));

  auto allocation = manager.AllocateResources(QUALITY_LEVEL_HIGH, PRIORITY_HIGH, SUBSCRIPTION_TIER_PREMIUM);
  bool threw      = false;
  try {
    manager.ValidateAllocation(allocation, SUBSCRIPTION_TIER_STANDARD);
  } catch (const coordinator::util::QuotaError& e) {
    threw = true;
    assert(e.PermittedCeiling() == "medium");
  }
  assert(threw);

  assert(manager.ValidateQualityForSubscription(QUALITY_LEVEL_MEDIUM, SUBSCRIPTION_TIER_STANDARD));
  assert(!manager.ValidateQualityForSubscription(QUALITY_LEVEL_HIGH, SUBSCRIPTION_TIER_STANDARD));
  assert(!manager.ValidateQualityForSubscription(QUALITY_LEVEL_MEDIUM, SUBSCRIPTION_TIER_UNSPECIFIED));
}

void TestUtilizationIsCachedAndSurvivesFailures() {
  auto cluster = Cluster(0.3);
  auto now     = std::make_shared<ResourceManager::SteadyClock::time_point>(ResourceManager::SteadyClock::now());

  coordinator::runtime::config::ResourcesConfig config;
  config.set_utilization_cache_ms(1000);
  ResourceManager manager(config, cluster, [now] { return *now; });

  assert(manager.GetResourceUtilization().cpu() == 0.3);
  assert(manager.GetResourceUtilization().cpu() == 0.3);
  assert(cluster->calls == 1);

  *now += std::chrono::milliseconds(1500);
  cluster->failing = true;
  assert(manager.GetResourceUtilization().cpu() == 0.3);
  assert(cluster->calls == 2);

  // the failed refresh still waits out the window
  assert(manager.GetResourceUtilization().cpu() == 0.3);
  assert(cluster->calls == 2);

  *now += std::chrono::milliseconds(1500);
  cluster->failing = false;
  cluster->SetUsage(0.7, 0.7);
  assert(manager.GetResourceUtilization().cpu() == 0.7);
  assert(manager.GetNodeMetrics().size() == 1);
}

void TestUnknownClusterDefaultsToHalfLoad() {
  ResourceManager manager(coordinator::runtime::config::ResourcesConfig{}, nullptr);
  const auto      utilization = manager.GetResourceUtilization();
  assert(utilization.cpu() == 0.5);
  assert(utilization.memory() == 0.5);
  assert(!manager.IsUnderHighLoad());
}

void TestQuantities() {
  using namespace coordinator::resources;
  assert(ParseCpuMillis("1.5") == 1500);
  assert(ParseCpuMillis("500m") == 500);
  assert(ParseMemoryBytes("8Gi") == 8LL << 30);
  assert(ParseMemoryBytes("512Mi") == 512LL << 20);
  assert(FormatMemoryBytes(3LL << 29) == "1536Mi");

  bool threw = false;
  try {
    ParseMemoryBytes("lots");
  } catch (const coordinator::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestConfiguredProfilesOverrideDefaults() {
  coordinator::runtime::config::ResourcesConfig config;
  config.mutable_low()->set_cpu("1");
  config.mutable_low()->set_memory("4Gi");
  ResourceManager manager(config, Cluster(0.1));

  const auto allocation = manager.AllocateResources(QUALITY_LEVEL_LOW, PRIORITY_MEDIUM, SUBSCRIPTION_TIER_STANDARD);
  assert(allocation.cpu() == "1000m");
  assert(allocation.memory() == "4Gi");
}

} // namespace

int main() {
  TestNodeSelectorAlwaysPermittedForTier();
  TestIdleClusterAllocatesProfiles();
  TestHighLoadShrinksLowPriorityWork();
  TestValidateAllocationRejectsPoolAboveTier();
  TestUtilizationIsCachedAndSurvivesFailures();
  TestUnknownClusterDefaultsToHalfLoad();
  TestQuantities();
  TestConfiguredProfilesOverrideDefaults();

  std::cout << "coordinator_unit_resource_manager: pass\n";
  return 0;
}
