#include "workflow_store.hpp"

#include <algorithm>
#include <iterator>

#include "internal/db/api/kv_store.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::workflow {

namespace {
constexpr const char* kPrefix = "records:workflow:";
}

WorkflowStore::WorkflowStore(std::shared_ptr<db::KvStore> store) : store_(std::move(store)) {
}

std::string WorkflowStore::Key(const std::string& id) {
  return kPrefix + id;
}

void WorkflowStore::Put(const coordinator::v1::WorkflowRecord& record) {
  const auto& id  = record.status().id();
  const auto  res = store_->Set(Key(id), record.SerializeAsString());
  if (!res) {
    throw util::TransientInfraError("persist workflow " + id + ": " + res.message);
  }

  std::unique_lock lock(records_mutex_);
  IndexLocked(record);
}

void WorkflowStore::IndexLocked(const coordinator::v1::WorkflowRecord& record) {
  const auto& id = record.status().id();
  auto        it = active_.find(id);

  if (model::IsTerminal(record.status().status())) {
    if (it == active_.end()) return;
    auto count = active_by_type_.find(it->second.status().type());
    if (count != active_by_type_.end() && --count->second == 0) active_by_type_.erase(count);
    active_.erase(it);
    return;
  }

  if (it == active_.end()) {
    ++active_by_type_[record.status().type()];
    active_.emplace(id, record);
  } else {
    it->second = record;
  }
}

std::optional<coordinator::v1::WorkflowRecord> WorkflowStore::Get(const std::string& id) const {
  {
    std::shared_lock lock(records_mutex_);
    auto             it = active_.find(id);
    if (it != active_.end()) return it->second;
  }

  const auto raw = store_->Get(Key(id));
  if (!raw) return std::nullopt;

  coordinator::v1::WorkflowRecord record;
  if (!record.ParseFromString(*raw)) {
    COORDINATOR_LOG_WARN("unreadable workflow record", {observability::StringField("workflow_id", id)});
    return std::nullopt;
  }
  return record;
}

bool WorkflowStore::Exists(const std::string& id) const {
  {
    std::shared_lock lock(records_mutex_);
    if (active_.count(id) > 0) return true;
  }
  return store_->Get(Key(id)).has_value();
}

std::vector<coordinator::v1::WorkflowRecord> WorkflowStore::ListActive() const {
  std::shared_lock                             lock(records_mutex_);
  std::vector<coordinator::v1::WorkflowRecord> out;
  out.reserve(active_.size());
  for (const auto& [id, record] : active_) out.push_back(record);
  return out;
}

std::size_t WorkflowStore::CountActive(const std::string& workflow_type) const {
  std::shared_lock lock(records_mutex_);
  auto             it = active_by_type_.find(workflow_type);
  return it == active_by_type_.end() ? 0 : it->second;
}

std::vector<coordinator::v1::WorkflowRecord> WorkflowStore::Hydrate() {
  std::vector<coordinator::v1::WorkflowRecord> active;
  std::size_t                                  loaded = 0;

  for (const auto& key : store_->ListKeys(kPrefix)) {
    const auto raw = store_->Get(key);
    if (!raw) continue;

    coordinator::v1::WorkflowRecord record;
    if (!record.ParseFromString(*raw)) {
      COORDINATOR_LOG_WARN("skipping unreadable workflow record", {observability::StringField("key", key)});
      continue;
    }
    ++loaded;
    if (model::IsTerminal(record.status().status())) continue;

    std::unique_lock lock(records_mutex_);
    IndexLocked(record);
    active.push_back(std::move(record));
  }

  COORDINATOR_LOG_INFO("workflow records hydrated",
                       {observability::IntField("records", static_cast<int64_t>(loaded)), observability::IntField("active", static_cast<int64_t>(active.size()))});
  return active;
}

std::shared_ptr<std::mutex> WorkflowStore::WorkflowMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(workflow_mutexes_guard_);
  auto&                       slot = workflow_mutexes_[id];
  if (auto held = slot.lock()) return held;

  auto workflow_mutex = std::make_shared<std::mutex>();
  slot                = workflow_mutex;

  // amortized sweep of ids nobody holds any more
  if (workflow_mutexes_.size() >= prune_at_) {
    for (auto it = workflow_mutexes_.begin(); it != workflow_mutexes_.end();) {
      it = it->second.expired() ? workflow_mutexes_.erase(it) : std::next(it);
    }
    prune_at_ = std::max<std::size_t>(64, workflow_mutexes_.size() * 2);
  }
  return workflow_mutex;
}

std::size_t WorkflowStore::TrackedMutexes() {
  std::lock_guard<std::mutex> lock(workflow_mutexes_guard_);
  return workflow_mutexes_.size();
}

} // namespace coordinator::workflow
