#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/kv_store.hpp"
#include "internal/util/time.hpp"

namespace coordinator::db::memory {

/*
  In-process store. Default backend and the backend used by tests.
*/
class MemoryStore final : public KvStore {
 public:
  std::optional<std::string> Get(const std::string& key) override;
  Result                     Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  Result                     Delete(const std::string& key) override;
  Result                     Increment(const std::string& key, int64_t delta, int64_t& value, std::chrono::milliseconds ttl) override;
  std::vector<std::string>   ListKeys(const std::string& prefix) override;
  Result                     Append(const std::string& list_key, const std::string& value, std::size_t max_length) override;
  std::vector<std::string>   Tail(const std::string& list_key, std::size_t count) override;
  Result                     Ping() override;

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at{};
  };

  static bool Expired(const Entry& entry, util::TimePoint now);

  std::mutex                                               mutex_;
  std::map<std::string, Entry>                             values_;
  std::unordered_map<std::string, std::deque<std::string>> lists_;
};

} // namespace coordinator::db::memory
