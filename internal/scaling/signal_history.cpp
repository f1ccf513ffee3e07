#include "signal_history.hpp"

#include "internal/db/api/kv_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::scaling {

SignalHistory::SignalHistory(std::shared_ptr<db::KvStore> store, std::size_t max_samples)
    : store_(std::move(store)), max_samples_(max_samples == 0 ? 1440 : max_samples) {
}

std::string SignalHistory::Key(const std::string& workload) {
  return "signals:" + workload;
}

void SignalHistory::Append(const coordinator::v1::ScalingSignal& signal) {
  const auto res = store_->Append(Key(signal.workload()), signal.SerializeAsString(), max_samples_);
  if (!res) {
    throw util::TransientInfraError("failed to record scaling signal for " + signal.workload() + ": " + res.message);
  }
}

std::vector<coordinator::v1::ScalingSignal> SignalHistory::Recent(const std::string& workload, std::size_t count) const {
  std::vector<coordinator::v1::ScalingSignal> out;
  for (const auto& raw : store_->Tail(Key(workload), count)) {
    coordinator::v1::ScalingSignal signal;
    if (!signal.ParseFromString(raw)) {
      COORDINATOR_LOG_WARN("skipping unreadable scaling signal", {observability::StringField("workload", workload)});
      continue;
    }
    out.push_back(std::move(signal));
  }
  return out;
}

} // namespace coordinator::scaling
