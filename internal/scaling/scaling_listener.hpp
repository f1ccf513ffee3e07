#pragma once

#include <cstdint>
#include <string>

namespace coordinator::scaling {

// Notified after a replica directive for `workload` went through.
class ScalingListener {
 public:
  virtual ~ScalingListener() = default;

  virtual void OnScalingEvent(const std::string& workload, uint32_t old_replicas, uint32_t new_replicas) = 0;
};

} // namespace coordinator::scaling
