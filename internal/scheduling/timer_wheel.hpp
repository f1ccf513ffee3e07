#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace coordinator::scheduling {

class WorkerPool;

/*
  Hashed timer wheel keyed by string id.

  One thread advances the wheel every tick; due callbacks are handed to a
  WorkerPool so a slow callback never delays other timers. Scheduling an
  existing key replaces its timer. Cancelled or replaced timers are
  dropped lazily when their slot comes up. A due timer the pool refuses
  stays scheduled and is retried on the next tick.
*/
class TimerWheel {
 public:
  using Callback = std::function<void()>;

  TimerWheel(std::chrono::milliseconds tick, std::size_t slots, std::shared_ptr<WorkerPool> pool);
  ~TimerWheel();

  TimerWheel(const TimerWheel&)            = delete;
  TimerWheel& operator=(const TimerWheel&) = delete;

  void Start();
  void Stop();

  void Schedule(const std::string& key, std::chrono::milliseconds delay, Callback callback);
  bool Cancel(const std::string& key);
  bool Contains(const std::string& key) const;
  std::size_t Size() const;

  // Advances one slot. Driven by the wheel thread; callable directly when
  // the wheel is not started.
  void Tick();

 private:
  struct Timer {
    std::string   key;
    std::uint64_t generation;
    std::size_t   rounds;
    Callback      callback;
  };

  void Loop();

  const std::chrono::milliseconds tick_;
  std::shared_ptr<WorkerPool>     pool_;

  mutable std::mutex                             mutex_;
  std::vector<std::list<Timer>>                  slots_;
  std::unordered_map<std::string, std::uint64_t> live_;
  std::size_t                                    cursor_ = 0;
  std::uint64_t                                  next_generation_ = 1;

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace coordinator::scheduling
