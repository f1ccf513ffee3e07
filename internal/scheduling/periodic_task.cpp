#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace coordinator::scheduling {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool PeriodicTask::Running() const {
  return running_;
}

void PeriodicTask::Loop() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return !running_; })) break;
    }

    try {
      fn_();
    } catch (const std::exception& e) {
      COORDINATOR_LOG_ERROR("periodic task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace coordinator::scheduling
