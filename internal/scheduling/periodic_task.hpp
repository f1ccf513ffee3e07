#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace coordinator::scheduling {

/*
  Runs a function on its own thread every interval.

  Stop() wakes the sleeper, lets a tick in progress finish and joins.
  Exceptions escaping the function are logged; the loop keeps going.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();
  bool Running() const;

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace coordinator::scheduling
