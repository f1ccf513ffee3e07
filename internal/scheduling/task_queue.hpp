#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace coordinator::scheduling {

/*
  Thread-safe blocking queue shared by workers.

  capacity == 0 means unbounded. After Shutdown() producers are refused
  and consumers drain what is left before Dequeue returns nullopt.
*/
template <typename T>
class TaskQueue {
 public:
  explicit TaskQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  // false when full or shut down
  bool TryEnqueue(T task) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_ || (capacity_ > 0 && queue_.size() >= capacity_)) return false;
      queue_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (shutdown_ && queue_.empty()) return std::nullopt;

    T task = std::move(queue_.front());
    queue_.pop();
    return task;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace coordinator::scheduling
