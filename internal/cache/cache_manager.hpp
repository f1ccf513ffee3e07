#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/core/v1/workflow.pb.h"

namespace coordinator::db {
class KvStore;
}
namespace coordinator::scheduling {
class WorkerPool;
}

namespace coordinator::cache {

struct ClaimResult {
  // true when the caller now owns the key
  bool        claimed = false;
  // owner of the in-flight claim, or producer of the cached result
  std::string workflow_id;
  // a finished result already exists for the key
  bool        completed = false;
};

/*
  Result cache keyed by request fingerprint.

  Entries live in the KvStore under "cache:<key>" and are only readable
  while now < created_at + ttl. Alongside results the manager tracks
  in-flight claims ("claim:<key>") so that identical requests arriving
  while the first is still running attach to it instead of submitting a
  second workflow.

  Every per-key operation holds one of a fixed set of striped mutexes.
*/
class CacheManager {
 public:
  CacheManager(const coordinator::runtime::config::CacheConfig& config, std::shared_ptr<db::KvStore> store,
               std::shared_ptr<scheduling::WorkerPool> purge_pool);

  /*
    "workflow:<type>:<sha256>" over type, the quality level the request
    resolved to and its parameters sorted by name. Requests that resolve
    to different levels (a clamped free-tier "high" against a premium
    "high") never share a key.
  */
  static std::string GenerateCacheKey(const coordinator::v1::WorkflowRequest& request, coordinator::v1::QualityLevel resolved_level);

  std::optional<coordinator::v1::CachedWorkflowResult> Get(const std::string& key);

  void Set(const std::string& key, const std::string& workflow_id, const std::string& result,
           std::chrono::seconds ttl = std::chrono::seconds::zero());

  // Removes the result for `key`; returns the number of entries removed.
  std::size_t Invalidate(const std::string& key);

  // Counts the entries of `workflow_type` and removes them on the purge pool.
  std::size_t InvalidateByType(const std::string& workflow_type);

  ClaimResult Claim(const std::string& key, const std::string& workflow_id);
  void        Release(const std::string& key, const std::string& workflow_id);
  void        Complete(const std::string& key, const std::string& workflow_id, const std::string& result);

  std::chrono::seconds DefaultTtl() const {
    return default_ttl_;
  }

 private:
  static std::string EntryKey(const std::string& key);
  static std::string ClaimKey(const std::string& key);

  std::mutex& StripeFor(const std::string& key);

  std::optional<coordinator::v1::CachedWorkflowResult> GetUnlocked(const std::string& key);
  void SetUnlocked(const std::string& key, const std::string& workflow_id, const std::string& result, std::chrono::seconds ttl);

  void Purge(const std::vector<std::string>& store_keys);

  std::shared_ptr<db::KvStore>            store_;
  std::shared_ptr<scheduling::WorkerPool> purge_pool_;
  std::chrono::seconds                    default_ttl_;
  std::vector<std::mutex>                 stripes_;
};

} // namespace coordinator::cache
