#include "timer_wheel.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "worker_pool.hpp"

namespace coordinator::scheduling {

TimerWheel::TimerWheel(std::chrono::milliseconds tick, std::size_t slots, std::shared_ptr<WorkerPool> pool)
    : tick_(tick.count() > 0 ? tick : std::chrono::milliseconds(100)), pool_(std::move(pool)), slots_(slots == 0 ? 1 : slots) {
}

TimerWheel::~TimerWheel() {
  Stop();
}

void TimerWheel::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&TimerWheel::Loop, this);
}

void TimerWheel::Stop() {
  {
    std::lock_guard lock(stop_mutex_);
    running_ = false;
  }
  stop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void TimerWheel::Schedule(const std::string& key, std::chrono::milliseconds delay, Callback callback) {
  std::lock_guard lock(mutex_);

  const auto        n     = slots_.size();
  const std::size_t ticks = std::max<std::size_t>(1, static_cast<std::size_t>((delay.count() + tick_.count() - 1) / tick_.count()));

  const auto generation = next_generation_++;
  live_[key]            = generation;
  slots_[(cursor_ + ticks) % n].push_back(Timer{key, generation, (ticks - 1) / n, std::move(callback)});
}

bool TimerWheel::Cancel(const std::string& key) {
  std::lock_guard lock(mutex_);
  return live_.erase(key) > 0;
}

bool TimerWheel::Contains(const std::string& key) const {
  std::lock_guard lock(mutex_);
  return live_.count(key) > 0;
}

std::size_t TimerWheel::Size() const {
  std::lock_guard lock(mutex_);
  return live_.size();
}

void TimerWheel::Tick() {
  std::vector<Timer> due;
  {
    std::lock_guard lock(mutex_);
    cursor_     = (cursor_ + 1) % slots_.size();
    auto& slot  = slots_[cursor_];

    for (auto it = slot.begin(); it != slot.end();) {
      auto live = live_.find(it->key);
      if (live == live_.end() || live->second != it->generation) {
        it = slot.erase(it);
        continue;
      }
      if (it->rounds > 0) {
        --it->rounds;
        ++it;
        continue;
      }
      live_.erase(live);
      due.push_back(std::move(*it));
      it = slot.erase(it);
    }
  }

  std::vector<Timer> deferred;
  for (auto& timer : due) {
    if (!pool_->Submit(timer.callback)) deferred.push_back(std::move(timer));
  }
  if (deferred.empty()) return;

  COORDINATOR_LOG_WARN("worker pool saturated, deferring timers one tick",
                       {observability::IntField("timers", static_cast<int64_t>(deferred.size()))});

  std::lock_guard lock(mutex_);
  const auto      next = (cursor_ + 1) % slots_.size();
  for (auto& timer : deferred) {
    // scheduled again while the callback was out; the newer timer wins
    if (live_.count(timer.key) > 0) continue;
    timer.generation = next_generation_++;
    timer.rounds     = 0;
    live_[timer.key] = timer.generation;
    slots_[next].push_back(std::move(timer));
  }
}

void TimerWheel::Loop() {
  auto next = std::chrono::steady_clock::now() + tick_;
  while (running_) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_until(lock, next, [&] { return !running_; })) break;
    }
    Tick();
    next += tick_;
  }
}

} // namespace coordinator::scheduling
