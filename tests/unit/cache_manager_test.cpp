#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/cache/cache_manager.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/util/time.hpp"

namespace {

using coordinator::cache::CacheManager;
using coordinator::v1::WorkflowRequest;

std::shared_ptr<coordinator::db::memory::MemoryStore> MakeStore() {
  return std::make_shared<coordinator::db::memory::MemoryStore>();
}

WorkflowRequest Request(const std::string& type) {
  WorkflowRequest request;
  request.set_type(type);
  request.set_user_id("user-1");
  request.set_quality_target(coordinator::v1::QUALITY_TARGET_MEDIUM);
  return request;
}

void TestCacheKeyIgnoresParameterOrder() {
  const std::vector<std::pair<std::string, std::string>> params = {
      {"format", "glb"}, {"input-images", "[\"a.png\",\"b.png\"]"}, {"scale", "2"}, {"seed", "7"}, {"up-axis", "z"}};

  auto reference = Request("3d-reconstruction");
  for (const auto& [k, v] : params) (*reference.mutable_parameters())[k] = v;
  const auto key = CacheManager::GenerateCacheKey(reference, coordinator::v1::QUALITY_LEVEL_MEDIUM);
  assert(key.rfind("workflow:3d-reconstruction:", 0) == 0);

  // every insertion order yields the same fingerprint
  std::vector<size_t> order = {0, 1, 2, 3, 4};
  int                 permutations = 0;
  do {
    auto request = Request("3d-reconstruction");
    for (size_t i : order) (*request.mutable_parameters())[params[i].first] = params[i].second;
    assert(CacheManager::GenerateCacheKey(request, coordinator::v1::QUALITY_LEVEL_MEDIUM) == key);
    ++permutations;
  } while (std::next_permutation(order.begin(), order.end()));
  assert(permutations == 120);

  // user and tier only matter through the resolved level
  auto other = reference;
  other.set_user_id("user-2");
  other.set_subscription_tier(coordinator::v1::SUBSCRIPTION_TIER_PREMIUM);
  assert(CacheManager::GenerateCacheKey(other, coordinator::v1::QUALITY_LEVEL_MEDIUM) == key);
}

void TestCacheKeyDistinguishesInputs() {
  auto a = Request("room-layout");
  (*a.mutable_parameters())["ab"] = "c";

  auto b = Request("room-layout");
  (*b.mutable_parameters())["a"] = "bc";

  const auto level = coordinator::v1::QUALITY_LEVEL_MEDIUM;
  const auto key   = CacheManager::GenerateCacheKey(a, level);
  assert(key != CacheManager::GenerateCacheKey(b, level));
  assert(key != CacheManager::GenerateCacheKey(Request("scene-graph-generation"), level));
}

void TestCacheKeyFollowsResolvedLevel() {
  auto high_target = Request("room-layout");
  high_target.set_quality_target(coordinator::v1::QUALITY_TARGET_HIGH);
  auto low_target = Request("room-layout");
  low_target.set_quality_target(coordinator::v1::QUALITY_TARGET_LOW);

  // a high target clamped to low shares results with a low target, never with high
  const auto clamped = CacheManager::GenerateCacheKey(high_target, coordinator::v1::QUALITY_LEVEL_LOW);
  assert(clamped == CacheManager::GenerateCacheKey(low_target, coordinator::v1::QUALITY_LEVEL_LOW));
  assert(clamped != CacheManager::GenerateCacheKey(high_target, coordinator::v1::QUALITY_LEVEL_HIGH));
  assert(CacheManager::GenerateCacheKey(high_target, coordinator::v1::QUALITY_LEVEL_MEDIUM) !=
         CacheManager::GenerateCacheKey(high_target, coordinator::v1::QUALITY_LEVEL_HIGH));
}

void TestExpiredEntryIsUnreadable() {
  auto                                   store = MakeStore();
  coordinator::runtime::config::CacheConfig config;
  CacheManager                           cache(config, store, nullptr);

  cache.Set("workflow:room-layout:fresh", "wf-1", "result", std::chrono::seconds(60));
  assert(cache.Get("workflow:room-layout:fresh").has_value());
  assert(cache.Get("workflow:room-layout:fresh")->workflow_id() == "wf-1");

  // an entry whose ttl has already elapsed
  coordinator::v1::CachedWorkflowResult stale;
  stale.set_cache_key("workflow:room-layout:stale");
  stale.set_workflow_id("wf-0");
  stale.set_result("old");
  stale.set_created_at_ms(coordinator::util::NowMillis() - 120'000);
  stale.set_ttl_seconds(60);
  assert(store->Set("cache:workflow:room-layout:stale", stale.SerializeAsString(), std::chrono::milliseconds(0)));

  assert(!cache.Get("workflow:room-layout:stale").has_value());
  // expiry deletes lazily
  assert(!store->Get("cache:workflow:room-layout:stale").has_value());
}

void TestDefaultTtlApplied() {
  auto                                   store = MakeStore();
  coordinator::runtime::config::CacheConfig config;
  CacheManager                           cache(config, store, nullptr);
  assert(cache.DefaultTtl() == std::chrono::hours(24));

  cache.Set("workflow:room-layout:k", "wf-1", "r");
  assert(cache.Get("workflow:room-layout:k")->ttl_seconds() == 24 * 3600);

  config.set_default_ttl_seconds(30);
  CacheManager short_cache(config, store, nullptr);
  assert(short_cache.DefaultTtl() == std::chrono::seconds(30));
}

void TestClaimSharesInFlightWorkflow() {
  auto                                   store = MakeStore();
  coordinator::runtime::config::CacheConfig config;
  CacheManager                           cache(config, store, nullptr);

  const std::string key = "workflow:material-recognition:abc";

  auto first = cache.Claim(key, "wf-1");
  assert(first.claimed);

  auto second = cache.Claim(key, "wf-2");
  assert(!second.claimed);
  assert(second.workflow_id == "wf-1");
  assert(!second.completed);

  // only the owner may release
  cache.Release(key, "wf-2");
  assert(!cache.Claim(key, "wf-3").claimed);

  cache.Complete(key, "wf-1", "outputs");
  auto third = cache.Claim(key, "wf-4");
  assert(!third.claimed);
  assert(third.completed);
  assert(third.workflow_id == "wf-1");
  assert(cache.Get(key)->result() == "outputs");
}

void TestReleaseLetsNextRequestClaim() {
  auto                                   store = MakeStore();
  coordinator::runtime::config::CacheConfig config;
  CacheManager                           cache(config, store, nullptr);

  const std::string key = "workflow:material-recognition:def";
  assert(cache.Claim(key, "wf-1").claimed);
  cache.Release(key, "wf-1");
  assert(cache.Claim(key, "wf-2").claimed);
}

void TestInvalidateByTypeRemovesOnlyThatType() {
  auto store = MakeStore();
  auto pool  = std::make_shared<coordinator::scheduling::WorkerPool>("cache-purge", 1);
  pool->Start();

  coordinator::runtime::config::CacheConfig config;
  CacheManager                           cache(config, store, pool);

  cache.Set("workflow:room-layout:1", "wf-1", "r");
  cache.Set("workflow:room-layout:2", "wf-2", "r");
  cache.Set("workflow:room-layout-v2:1", "wf-3", "r");
  cache.Set("workflow:scene-graph-generation:1", "wf-4", "r");

  assert(cache.InvalidateByType("room-layout") == 2);
  pool->Stop();

  assert(!cache.Get("workflow:room-layout:1").has_value());
  assert(!cache.Get("workflow:room-layout:2").has_value());
  assert(cache.Get("workflow:room-layout-v2:1").has_value());
  assert(cache.Get("workflow:scene-graph-generation:1").has_value());

  assert(cache.Invalidate("workflow:scene-graph-generation:1") == 1);
  assert(cache.Invalidate("workflow:scene-graph-generation:1") == 0);
}

} // namespace

int main() {
  TestCacheKeyIgnoresParameterOrder();
  TestCacheKeyDistinguishesInputs();
  TestCacheKeyFollowsResolvedLevel();
  TestExpiredEntryIsUnreadable();
  TestDefaultTtlApplied();
  TestClaimSharesInFlightWorkflow();
  TestReleaseLetsNextRequestClaim();
  TestInvalidateByTypeRemovesOnlyThatType();

  std::cout << "coordinator_unit_cache_manager: pass\n";
  return 0;
}
