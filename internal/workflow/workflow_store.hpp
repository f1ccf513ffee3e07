#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "coordinator/core/v1/workflow.pb.h"

namespace coordinator::db {
class KvStore;
}

namespace coordinator::workflow {

/*
  Durable WorkflowRecord storage with an in-memory index of active
  records.

  Records are written through to the KvStore under
  "records:workflow:<id>". Only non-terminal records stay in the index;
  a record that reaches a terminal phase is dropped from it and later
  reads go to the store. Callers that read-modify-write a record hold
  its WorkflowMutex for the duration.
*/
class WorkflowStore {
 public:
  explicit WorkflowStore(std::shared_ptr<db::KvStore> store);

  // Throws util::TransientInfraError when the store rejects the write.
  void Put(const coordinator::v1::WorkflowRecord& record);

  std::optional<coordinator::v1::WorkflowRecord> Get(const std::string& id) const;

  bool Exists(const std::string& id) const;

  std::vector<coordinator::v1::WorkflowRecord> ListActive() const;

  std::size_t CountActive(const std::string& workflow_type) const;

  // Loads the persisted non-terminal records into the index and returns them.
  std::vector<coordinator::v1::WorkflowRecord> Hydrate();

  // Mutexes live while someone holds them; released ids are pruned.
  std::shared_ptr<std::mutex> WorkflowMutex(const std::string& id);

  std::size_t TrackedMutexes();

  static std::string Key(const std::string& id);

 private:
  void IndexLocked(const coordinator::v1::WorkflowRecord& record);

  std::shared_ptr<db::KvStore> store_;

  mutable std::shared_mutex                               records_mutex_;
  std::map<std::string, coordinator::v1::WorkflowRecord> active_;
  std::unordered_map<std::string, std::size_t>            active_by_type_;

  std::mutex                                                 workflow_mutexes_guard_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> workflow_mutexes_;
  std::size_t                                                prune_at_ = 64;
};

} // namespace coordinator::workflow
