#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"

namespace coordinator::db {

/*
  Key/value store backing caches, quality history, workflow records and
  metric series.

  Values are opaque bytes (serialized protobuf or decimal counters).
  Expired keys behave as absent. Lists are append-only and bounded:
  Append drops the oldest entries beyond max_length.
*/
class KvStore {
 public:
  virtual ~KvStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // ttl of zero means no expiry
  virtual Result Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl = std::chrono::milliseconds::zero()) = 0;

  virtual Result Delete(const std::string& key) = 0;

  // Missing keys start at zero. ttl applies only when the key is created.
  virtual Result Increment(const std::string& key, int64_t delta, int64_t& value,
                           std::chrono::milliseconds ttl = std::chrono::milliseconds::zero()) = 0;

  virtual std::vector<std::string> ListKeys(const std::string& prefix) = 0;

  virtual Result Append(const std::string& list_key, const std::string& value, std::size_t max_length) = 0;

  // Newest `count` entries, oldest first.
  virtual std::vector<std::string> Tail(const std::string& list_key, std::size_t count) = 0;

  // Cheap round trip used by readiness probes.
  virtual Result Ping() = 0;
};

} // namespace coordinator::db
