#include "cache_manager.hpp"

#include <functional>
#include <map>

#include "internal/db/api/kv_store.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace coordinator::cache {

namespace {

constexpr std::chrono::seconds kDefaultTtl{24 * 3600};
constexpr std::size_t          kDefaultStripes = 64;

// a claim outlives any sane workflow; it only matters if the owner never completes
constexpr std::chrono::hours kClaimTtl{6};

// length-prefixed so that separators inside values cannot collide
void AppendField(std::string& out, const std::string& value) {
  out += std::to_string(value.size());
  out += ':';
  out += value;
  out += ';';
}

} // namespace

CacheManager::CacheManager(const coordinator::runtime::config::CacheConfig& config, std::shared_ptr<db::KvStore> store,
                           std::shared_ptr<scheduling::WorkerPool> purge_pool)
    : store_(std::move(store)),
      purge_pool_(std::move(purge_pool)),
      default_ttl_(config.default_ttl_seconds() > 0 ? std::chrono::seconds(config.default_ttl_seconds()) : kDefaultTtl),
      stripes_(config.lock_stripes() > 0 ? config.lock_stripes() : kDefaultStripes) {
}

std::string CacheManager::GenerateCacheKey(const coordinator::v1::WorkflowRequest& request, coordinator::v1::QualityLevel resolved_level) {
  // protobuf maps have no stable iteration order
  const std::map<std::string, std::string> sorted(request.parameters().begin(), request.parameters().end());

  std::string canonical;
  AppendField(canonical, request.type());
  AppendField(canonical, std::string(model::ToString(resolved_level)));
  for (const auto& [key, value] : sorted) {
    AppendField(canonical, key);
    AppendField(canonical, value);
  }

  return "workflow:" + request.type() + ":" + util::Sha256Hex(canonical);
}

std::string CacheManager::EntryKey(const std::string& key) {
  return "cache:" + key;
}

std::string CacheManager::ClaimKey(const std::string& key) {
  return "claim:" + key;
}

std::mutex& CacheManager::StripeFor(const std::string& key) {
  return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
}

std::optional<coordinator::v1::CachedWorkflowResult> CacheManager::Get(const std::string& key) {
  std::lock_guard lock(StripeFor(key));
  return GetUnlocked(key);
}

std::optional<coordinator::v1::CachedWorkflowResult> CacheManager::GetUnlocked(const std::string& key) {
  const auto raw = store_->Get(EntryKey(key));
  if (!raw) return std::nullopt;

  coordinator::v1::CachedWorkflowResult entry;
  if (!entry.ParseFromString(*raw)) {
    const auto res = store_->Delete(EntryKey(key));
    COORDINATOR_LOG_WARN("dropping unreadable cache entry", {observability::StringField("key", key), observability::BoolField("deleted", static_cast<bool>(res))});
    return std::nullopt;
  }

  const int64_t expires_at_ms = entry.created_at_ms() + static_cast<int64_t>(entry.ttl_seconds()) * 1000;
  if (util::NowMillis() >= expires_at_ms) {
    const auto res = store_->Delete(EntryKey(key));
    if (!res) {
      COORDINATOR_LOG_WARN("failed to delete expired cache entry", {observability::StringField("key", key), observability::StringField("error", res.message)});
    }
    return std::nullopt;
  }
  return entry;
}

void CacheManager::Set(const std::string& key, const std::string& workflow_id, const std::string& result, std::chrono::seconds ttl) {
  std::lock_guard lock(StripeFor(key));
  SetUnlocked(key, workflow_id, result, ttl);
}

void CacheManager::SetUnlocked(const std::string& key, const std::string& workflow_id, const std::string& result, std::chrono::seconds ttl) {
  if (ttl <= std::chrono::seconds::zero()) ttl = default_ttl_;

  coordinator::v1::CachedWorkflowResult entry;
  entry.set_cache_key(key);
  entry.set_workflow_id(workflow_id);
  entry.set_result(result);
  entry.set_created_at_ms(util::NowMillis());
  entry.set_ttl_seconds(static_cast<uint32_t>(ttl.count()));

  const auto res = store_->Set(EntryKey(key), entry.SerializeAsString(), std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
  if (!res) {
    COORDINATOR_LOG_WARN("failed to write cache entry",
                         {observability::StringField("key", key), observability::StringField("workflow_id", workflow_id),
                          observability::StringField("error", res.message)});
  }
}

std::size_t CacheManager::Invalidate(const std::string& key) {
  std::lock_guard lock(StripeFor(key));
  if (!store_->Get(EntryKey(key))) return 0;

  const auto res = store_->Delete(EntryKey(key));
  if (!res) {
    COORDINATOR_LOG_WARN("failed to invalidate cache entry", {observability::StringField("key", key), observability::StringField("error", res.message)});
    return 0;
  }
  return 1;
}

std::size_t CacheManager::InvalidateByType(const std::string& workflow_type) {
  auto keys = store_->ListKeys(EntryKey("workflow:" + workflow_type + ":"));
  const auto count = keys.size();
  if (count == 0) return 0;

  COORDINATOR_LOG_INFO("invalidating cache entries by type",
                       {observability::StringField("type", workflow_type), observability::IntField("entries", static_cast<int64_t>(count))});

  if (!purge_pool_ || !purge_pool_->Submit([this, keys] { Purge(keys); })) {
    Purge(keys);
  }
  return count;
}

void CacheManager::Purge(const std::vector<std::string>& store_keys) {
  const std::string prefix = EntryKey("");
  for (const auto& store_key : store_keys) {
    const auto key = store_key.substr(prefix.size());
    std::lock_guard lock(StripeFor(key));
    const auto res = store_->Delete(store_key);
    if (!res) {
      COORDINATOR_LOG_WARN("cache purge failed", {observability::StringField("key", key), observability::StringField("error", res.message)});
    }
  }
}

ClaimResult CacheManager::Claim(const std::string& key, const std::string& workflow_id) {
  std::lock_guard lock(StripeFor(key));

  if (auto entry = GetUnlocked(key)) {
    return {false, entry->workflow_id(), true};
  }
  if (auto owner = store_->Get(ClaimKey(key))) {
    return {false, *owner, false};
  }

  const auto res = store_->Set(ClaimKey(key), workflow_id, kClaimTtl);
  if (!res) {
    // without a claim the request still runs, it just cannot be shared
    COORDINATOR_LOG_WARN("failed to record in-flight claim", {observability::StringField("key", key), observability::StringField("error", res.message)});
  }
  return {true, workflow_id, false};
}

void CacheManager::Release(const std::string& key, const std::string& workflow_id) {
  std::lock_guard lock(StripeFor(key));

  const auto owner = store_->Get(ClaimKey(key));
  if (!owner || *owner != workflow_id) return;

  const auto res = store_->Delete(ClaimKey(key));
  if (!res) {
    COORDINATOR_LOG_WARN("failed to release claim", {observability::StringField("key", key), observability::StringField("error", res.message)});
  }
}

void CacheManager::Complete(const std::string& key, const std::string& workflow_id, const std::string& result) {
  std::lock_guard lock(StripeFor(key));

  SetUnlocked(key, workflow_id, result, default_ttl_);

  const auto owner = store_->Get(ClaimKey(key));
  if (owner && *owner == workflow_id) {
    const auto res = store_->Delete(ClaimKey(key));
    if (!res) {
      COORDINATOR_LOG_WARN("failed to drop claim", {observability::StringField("key", key), observability::StringField("error", res.message)});
    }
  }
}

} // namespace coordinator::cache
