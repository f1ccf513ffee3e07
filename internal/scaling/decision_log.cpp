#include "decision_log.hpp"

#include "internal/db/api/kv_store.hpp"
#include "internal/observability/logging.hpp"

namespace coordinator::scaling {

namespace {
constexpr std::size_t kMaxDecisions = 100;
}

DecisionLog::DecisionLog(std::shared_ptr<db::KvStore> store) : store_(std::move(store)) {
}

std::string DecisionLog::Key(const std::string& workload) {
  return "scaling:decisions:" + workload;
}

void DecisionLog::Append(const coordinator::v1::ScalingDecision& decision) {
  if (!store_) return;

  const auto res = store_->Append(Key(decision.workload()), decision.SerializeAsString(), kMaxDecisions);
  if (!res) {
    COORDINATOR_LOG_WARN("failed to persist scaling decision",
                         {observability::StringField("workload", decision.workload()), observability::StringField("error", res.message)});
  }
}

std::vector<coordinator::v1::ScalingDecision> DecisionLog::Recent(const std::string& workload, std::size_t count) const {
  std::vector<coordinator::v1::ScalingDecision> out;
  if (!store_) return out;

  for (const auto& raw : store_->Tail(Key(workload), count)) {
    coordinator::v1::ScalingDecision decision;
    if (decision.ParseFromString(raw)) out.push_back(std::move(decision));
  }
  return out;
}

} // namespace coordinator::scaling
