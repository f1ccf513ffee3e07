#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace coordinator::scheduling {
class TimerWheel;
}

namespace coordinator::workflow {

/*
  Polls in-flight workflows through a shared TimerWheel. Every tracked id
  owns exactly one timer; the poll function returns false once the
  workflow is terminal, which drops the id.
*/
class StatusPoller {
 public:
  // true while the workflow still needs polling
  using PollFn = std::function<bool(const std::string& workflow_id)>;

  StatusPoller(std::shared_ptr<scheduling::TimerWheel> wheel, std::chrono::milliseconds interval, PollFn poll);

  void Track(const std::string& workflow_id);
  void Untrack(const std::string& workflow_id);

  bool        Tracking(const std::string& workflow_id) const;
  std::size_t Size() const;

 private:
  void Schedule(const std::string& workflow_id);
  void Fire(const std::string& workflow_id);

  std::shared_ptr<scheduling::TimerWheel> wheel_;
  std::chrono::milliseconds               interval_;
  PollFn                                  poll_;

  mutable std::mutex              mutex_;
  std::unordered_set<std::string> tracked_;
};

} // namespace coordinator::workflow
