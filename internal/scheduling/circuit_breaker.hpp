#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace coordinator::scheduling {

/*
  Circuit breaker for calls into the execution engine and autoscaler.

    closed    -> open       after failure_threshold consecutive transient failures
    open      -> half-open  once reset_timeout has elapsed; one trial call is let through
    half-open -> closed     on success
    half-open -> open       on failure

  Only TransientInfraError counts as a failure; NotFound and validation
  errors are answers, not outages.
*/
class CircuitBreaker {
 public:
  enum class State { kClosed, kOpen, kHalfOpen };

  using SteadyClock = std::chrono::steady_clock;
  using ClockFn     = std::function<SteadyClock::time_point()>;

  CircuitBreaker(std::string name, uint32_t failure_threshold, std::chrono::milliseconds reset_timeout, ClockFn clock = {});

  bool Allow();
  void RecordSuccess();
  void RecordFailure();

  State CurrentState() const;

  const std::string& Name() const {
    return name_;
  }

  template <typename Fn>
  auto Call(Fn&& fn) -> decltype(fn()) {
    if (!Allow()) {
      throw util::TransientInfraError(name_ + " circuit open");
    }
    try {
      if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        RecordSuccess();
      } else {
        auto result = fn();
        RecordSuccess();
        return result;
      }
    } catch (const util::TransientInfraError&) {
      RecordFailure();
      throw;
    } catch (const std::exception&) {
      // the dependency answered, just not with what we wanted
      RecordSuccess();
      throw;
    }
  }

 private:
  std::string               name_;
  uint32_t                  failure_threshold_;
  std::chrono::milliseconds reset_timeout_;
  ClockFn                   clock_;

  mutable std::mutex      mutex_;
  State                   state_            = State::kClosed;
  uint32_t                failures_         = 0;
  bool                    trial_in_flight_  = false;
  SteadyClock::time_point opened_at_{};
};

const char* ToString(CircuitBreaker::State state);

} // namespace coordinator::scheduling
