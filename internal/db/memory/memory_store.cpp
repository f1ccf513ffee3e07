#include "memory_store.hpp"

#include <algorithm>

namespace coordinator::db::memory {

bool MemoryStore::Expired(const Entry& entry, util::TimePoint now) {
  return entry.expires_at != util::TimePoint{} && now >= entry.expires_at;
}

std::optional<std::string> MemoryStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;

  if (Expired(it->second, util::Now())) {
    values_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

Result MemoryStore::Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  Entry entry{value, {}};
  if (ttl.count() > 0) {
    entry.expires_at = util::Now() + ttl;
  }
  values_[key] = std::move(entry);
  return Result::Ok();
}

Result MemoryStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  values_.erase(key);
  lists_.erase(key);
  return Result::Ok();
}

Result MemoryStore::Increment(const std::string& key, int64_t delta, int64_t& value, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  auto       it  = values_.find(key);
  if (it != values_.end() && Expired(it->second, now)) {
    values_.erase(it);
    it = values_.end();
  }

  int64_t current = 0;
  if (it != values_.end()) {
    try {
      current = std::stoll(it->second.value);
    } catch (const std::exception&) {
      return Result::Err(ErrorCode::InvalidArgument, "value at " + key + " is not an integer");
    }
  }

  value = current + delta;
  if (it == values_.end()) {
    Entry entry{std::to_string(value), {}};
    if (ttl.count() > 0) entry.expires_at = now + ttl;
    values_.emplace(key, std::move(entry));
  } else {
    it->second.value = std::to_string(value);
  }
  return Result::Ok();
}

std::vector<std::string> MemoryStore::ListKeys(const std::string& prefix) {
  std::lock_guard lock(mutex_);

  const auto               now = util::Now();
  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix); it != values_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    if (!Expired(it->second, now)) {
      keys.push_back(it->first);
    }
  }
  return keys;
}

Result MemoryStore::Append(const std::string& list_key, const std::string& value, std::size_t max_length) {
  std::lock_guard lock(mutex_);

  auto& list = lists_[list_key];
  list.push_back(value);
  while (max_length > 0 && list.size() > max_length) {
    list.pop_front();
  }
  return Result::Ok();
}

std::vector<std::string> MemoryStore::Tail(const std::string& list_key, std::size_t count) {
  std::lock_guard lock(mutex_);

  auto it = lists_.find(list_key);
  if (it == lists_.end()) return {};

  const auto& list  = it->second;
  const auto  n     = std::min(count, list.size());
  return {list.end() - static_cast<std::ptrdiff_t>(n), list.end()};
}

Result MemoryStore::Ping() {
  return Result::Ok();
}

} // namespace coordinator::db::memory
