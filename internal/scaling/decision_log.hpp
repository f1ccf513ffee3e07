#pragma once

#include <memory>
#include <string>
#include <vector>

#include "coordinator/scaling/v1/scaling.pb.h"

namespace coordinator::db {
class KvStore;
}

namespace coordinator::scaling {

// Last 100 directives per workload under "scaling:decisions:<workload>".
class DecisionLog {
 public:
  explicit DecisionLog(std::shared_ptr<db::KvStore> store);

  // Logs and drops store failures.
  void Append(const coordinator::v1::ScalingDecision& decision);

  std::vector<coordinator::v1::ScalingDecision> Recent(const std::string& workload, std::size_t count) const;

  static std::string Key(const std::string& workload);

 private:
  std::shared_ptr<db::KvStore> store_;
};

} // namespace coordinator::scaling
