#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "coordinator/scaling/v1/scaling.pb.h"

namespace coordinator::db {
class KvStore;
}

namespace coordinator::scaling {

/*
  Append-only series of ScalingSignal per workload, kept in the KvStore
  list "signals:<workload>" and trimmed to max_samples.
*/
class SignalHistory {
 public:
  SignalHistory(std::shared_ptr<db::KvStore> store, std::size_t max_samples);

  // Throws util::TransientInfraError when the store rejects the write.
  void Append(const coordinator::v1::ScalingSignal& signal);

  // Newest `count` signals, oldest first. Unreadable entries are skipped.
  std::vector<coordinator::v1::ScalingSignal> Recent(const std::string& workload, std::size_t count) const;

  static std::string Key(const std::string& workload);

 private:
  std::shared_ptr<db::KvStore> store_;
  std::size_t                  max_samples_;
};

} // namespace coordinator::scaling
