#include "status_poller.hpp"

#include "internal/observability/logging.hpp"
#include "internal/scheduling/timer_wheel.hpp"

namespace coordinator::workflow {

StatusPoller::StatusPoller(std::shared_ptr<scheduling::TimerWheel> wheel, std::chrono::milliseconds interval, PollFn poll)
    : wheel_(std::move(wheel)), interval_(interval), poll_(std::move(poll)) {
}

void StatusPoller::Track(const std::string& workflow_id) {
  {
    std::lock_guard lock(mutex_);
    if (!tracked_.insert(workflow_id).second) return;
  }
  Schedule(workflow_id);
}

void StatusPoller::Untrack(const std::string& workflow_id) {
  {
    std::lock_guard lock(mutex_);
    tracked_.erase(workflow_id);
  }
  wheel_->Cancel(workflow_id);
}

bool StatusPoller::Tracking(const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);
  return tracked_.count(workflow_id) > 0;
}

std::size_t StatusPoller::Size() const {
  std::lock_guard lock(mutex_);
  return tracked_.size();
}

void StatusPoller::Schedule(const std::string& workflow_id) {
  wheel_->Schedule(workflow_id, interval_, [this, workflow_id] { Fire(workflow_id); });
}

void StatusPoller::Fire(const std::string& workflow_id) {
  if (!Tracking(workflow_id)) return;

  bool keep = true;
  try {
    keep = poll_(workflow_id);
  } catch (const std::exception& e) {
    COORDINATOR_LOG_WARN("status poll failed", {observability::StringField("workflow_id", workflow_id), observability::StringField("error", e.what())});
  }

  if (!keep) {
    std::lock_guard lock(mutex_);
    tracked_.erase(workflow_id);
    return;
  }
  if (Tracking(workflow_id)) Schedule(workflow_id);
}

} // namespace coordinator::workflow
