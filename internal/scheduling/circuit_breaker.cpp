#include "circuit_breaker.hpp"

#include "internal/observability/logging.hpp"

namespace coordinator::scheduling {

CircuitBreaker::CircuitBreaker(std::string name, uint32_t failure_threshold, std::chrono::milliseconds reset_timeout, ClockFn clock)
    : name_(std::move(name)),
      failure_threshold_(failure_threshold == 0 ? 5 : failure_threshold),
      reset_timeout_(reset_timeout.count() > 0 ? reset_timeout : std::chrono::milliseconds(30000)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return SteadyClock::now(); };
  }
}

bool CircuitBreaker::Allow() {
  std::lock_guard lock(mutex_);

  switch (state_) {
    case State::kClosed:
      return true;
    case State::kOpen:
      if (clock_() - opened_at_ < reset_timeout_) {
        return false;
      }
      state_           = State::kHalfOpen;
      trial_in_flight_ = true;
      COORDINATOR_LOG_INFO("circuit half-open", {observability::StringField("breaker", name_)});
      return true;
    case State::kHalfOpen:
      if (trial_in_flight_) {
        return false;
      }
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard lock(mutex_);

  if (state_ != State::kClosed) {
    COORDINATOR_LOG_INFO("circuit closed", {observability::StringField("breaker", name_)});
  }
  state_           = State::kClosed;
  failures_        = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard lock(mutex_);

  trial_in_flight_ = false;
  ++failures_;
  if (state_ == State::kHalfOpen || failures_ >= failure_threshold_) {
    if (state_ != State::kOpen) {
      COORDINATOR_LOG_WARN("circuit opened", {observability::StringField("breaker", name_), observability::IntField("failures", failures_)});
    }
    state_     = State::kOpen;
    opened_at_ = clock_();
  }
}

CircuitBreaker::State CircuitBreaker::CurrentState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

const char* ToString(CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::kClosed:
      return "closed";
    case CircuitBreaker::State::kOpen:
      return "open";
    case CircuitBreaker::State::kHalfOpen:
      return "half-open";
  }
  return "unknown";
}

} // namespace coordinator::scheduling
