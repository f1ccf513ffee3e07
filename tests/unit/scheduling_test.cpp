#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <stdexcept>
#include <thread>

#include "config/config.pb.h"
#include "internal/scheduling/circuit_breaker.hpp"
#include "internal/scheduling/periodic_task.hpp"
#include "internal/scheduling/retry_policy.hpp"
#include "internal/scheduling/timer_wheel.hpp"
#include "internal/scheduling/worker_pool.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/status_poller.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using coordinator::scheduling::CircuitBreaker;
using coordinator::scheduling::RetryOptions;
using coordinator::scheduling::RetryPolicy;
using coordinator::scheduling::TimerWheel;
using coordinator::scheduling::WorkerPool;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

void TestWorkerPoolRunsAndDrains() {
  WorkerPool pool("test", 2);
  pool.Start();

  std::atomic<int> ran{0};
  for (int i = 0; i < 100; ++i) {
    assert(pool.Submit([&] { ++ran; }));
  }
  // a throwing task does not take a worker down
  assert(pool.Submit([] { throw std::runtime_error("boom"); }));

  pool.Stop();
  assert(ran == 100);
  assert(!pool.Submit([] {}));
}

void TestWorkerPoolCapacity() {
  // not started, so nothing is consumed
  WorkerPool pool("bounded", 1, 2);
  assert(pool.Submit([] {}));
  assert(pool.Submit([] {}));
  assert(!pool.Submit([] {}));
  assert(pool.Pending() == 2);
}

void TestTimerFiresAfterDelay() {
  auto       pool = std::make_shared<WorkerPool>("timers", 1, 0);
  TimerWheel wheel(10ms, 8, pool);

  wheel.Schedule("wf-1", 30ms, [] {});
  assert(wheel.Contains("wf-1"));

  wheel.Tick();
  wheel.Tick();
  assert(pool->Pending() == 0);
  wheel.Tick();
  assert(pool->Pending() == 1);
  assert(!wheel.Contains("wf-1"));
  assert(wheel.Size() == 0);
}

void TestTimerLongerThanOneRevolution() {
  auto       pool = std::make_shared<WorkerPool>("timers", 1, 0);
  TimerWheel wheel(10ms, 4, pool);

  // 10 ticks on a 4-slot wheel
  wheel.Schedule("wf-1", 100ms, [] {});
  for (int i = 0; i < 9; ++i) wheel.Tick();
  assert(pool->Pending() == 0);
  assert(wheel.Contains("wf-1"));
  wheel.Tick();
  assert(pool->Pending() == 1);
}

void TestTimerCancelAndReplace() {
  auto       pool = std::make_shared<WorkerPool>("timers", 1, 0);
  TimerWheel wheel(10ms, 8, pool);

  wheel.Schedule("cancelled", 10ms, [] {});
  assert(wheel.Cancel("cancelled"));
  assert(!wheel.Cancel("cancelled"));

  wheel.Schedule("replaced", 10ms, [] {});
  wheel.Schedule("replaced", 30ms, [] {});
  assert(wheel.Size() == 1);

  wheel.Tick();
  assert(pool->Pending() == 0);
  wheel.Tick();
  wheel.Tick();
  assert(pool->Pending() == 1);
}

void TestTimerSurvivesSaturatedPool() {
  // not started yet, so queued work stays queued
  auto       pool = std::make_shared<WorkerPool>("timers", 1, 4);
  TimerWheel wheel(10ms, 8, pool);

  std::atomic<int> fired{0};
  wheel.Schedule("wf-1", 10ms, [&] { ++fired; });
  wheel.Schedule("wf-2", 10ms, [&] { ++fired; });
  for (int i = 0; i < 3; ++i) assert(pool->Submit([] {}));

  // one free place: wf-1 is handed over, wf-2 stays live
  wheel.Tick();
  assert(pool->Pending() == 4);
  assert(wheel.Size() == 1);
  assert(wheel.Contains("wf-2"));

  // still full, still deferred
  wheel.Tick();
  assert(wheel.Contains("wf-2"));

  pool->Start();
  while (pool->Pending() > 0) std::this_thread::sleep_for(1ms);
  wheel.Tick();
  assert(wheel.Size() == 0);

  pool->Stop();
  assert(fired == 2);
}

void TestTimerCallbacksRunOnPool() {
  auto pool = std::make_shared<WorkerPool>("timers", 2, 0);
  pool->Start();
  TimerWheel wheel(5ms, 16, pool);
  wheel.Start();

  std::atomic<int> fired{0};
  for (int i = 0; i < 5; ++i) {
    wheel.Schedule("t" + std::to_string(i), 10ms, [&] { ++fired; });
  }
  assert(WaitFor([&] { return fired == 5; }));

  wheel.Stop();
  pool->Stop();
}

void TestStatusPollerStopsWhenPollSaysDone() {
  auto pool  = std::make_shared<WorkerPool>("poll", 1, 0);
  auto wheel = std::make_shared<TimerWheel>(10ms, 8, pool);

  std::atomic<int> polls{0};
  coordinator::workflow::StatusPoller poller(wheel, 10ms, [&](const std::string&) { return ++polls < 2; });

  poller.Track("wf-1");
  poller.Track("wf-1");
  assert(poller.Size() == 1);
  assert(wheel->Contains("wf-1"));

  pool->Start();
  wheel->Tick();
  assert(WaitFor([&] { return polls == 1 && wheel->Contains("wf-1"); }));

  wheel->Tick();
  assert(WaitFor([&] { return polls == 2 && !poller.Tracking("wf-1"); }));
  assert(!wheel->Contains("wf-1"));

  pool->Stop();
}

void TestStatusPollerUntrack() {
  auto pool  = std::make_shared<WorkerPool>("poll", 1, 0);
  auto wheel = std::make_shared<TimerWheel>(10ms, 8, pool);

  coordinator::workflow::StatusPoller poller(wheel, 10ms, [](const std::string&) { return true; });
  poller.Track("wf-1");
  poller.Untrack("wf-1");
  assert(!poller.Tracking("wf-1"));
  assert(!wheel->Contains("wf-1"));

  wheel->Tick();
  assert(pool->Pending() == 0);
}

void TestBackoffDelays() {
  RetryOptions options;
  options.initial_backoff = 200ms;
  options.multiplier      = 2.0;
  options.max_backoff     = 1000ms;

  assert(coordinator::scheduling::BackoffDelay(options, 1) == 200ms);
  assert(coordinator::scheduling::BackoffDelay(options, 2) == 400ms);
  assert(coordinator::scheduling::BackoffDelay(options, 3) == 800ms);
  assert(coordinator::scheduling::BackoffDelay(options, 4) == 1000ms);
}

void TestRetryOnlyRetriesTransientErrors() {
  coordinator::testing::RecordingSleeper sleeper;
  RetryOptions                           options;
  options.max_attempts    = 4;
  options.initial_backoff = 50ms;
  RetryPolicy policy(options, sleeper);

  int      calls    = 0;
  uint32_t attempts = 0;
  const auto value  = policy.Execute(
      "flaky", [&] {
        if (++calls < 3) throw coordinator::util::TransientInfraError("unavailable");
        return 42;
      },
      &attempts);
  assert(value == 42);
  assert(attempts == 3);
  assert(sleeper.delays->size() == 2);

  calls      = 0;
  bool threw = false;
  try {
    policy.Execute("rejected", [&] {
      ++calls;
      throw coordinator::util::ValidationError("bad input");
    });
  } catch (const coordinator::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 1);

  calls = 0;
  threw = false;
  try {
    policy.Execute("down", [&] {
      ++calls;
      throw coordinator::util::TransientInfraError("still down");
    });
  } catch (const coordinator::util::TransientInfraError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 4);
}

void TestRetryOptionsFromConfig() {
  coordinator::runtime::config::RetryConfig config;
  config.set_max_attempts(5);
  const auto options = RetryOptions::FromConfig(config);
  assert(options.max_attempts == 5);
  // unset fields keep their defaults
  assert(options.initial_backoff == RetryOptions{}.initial_backoff);
  assert(options.multiplier == RetryOptions{}.multiplier);
}

void TestCircuitBreakerTransitions() {
  auto           now   = std::chrono::steady_clock::time_point{};
  CircuitBreaker breaker("engine", 3, 1000ms, [&] { return now; });

  auto fail = [] { throw coordinator::util::TransientInfraError("down"); };
  for (int i = 0; i < 3; ++i) {
    bool threw = false;
    try {
      breaker.Call(fail);
    } catch (const coordinator::util::TransientInfraError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(breaker.CurrentState() == CircuitBreaker::State::kOpen);

  // rejected without calling through
  int calls = 0;
  bool threw = false;
  try {
    breaker.Call([&] { ++calls; });
  } catch (const coordinator::util::TransientInfraError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 0);

  // after the reset timeout one trial goes through; a failure re-opens
  now += 1000ms;
  threw = false;
  try {
    breaker.Call(fail);
  } catch (const coordinator::util::TransientInfraError&) {
    threw = true;
  }
  assert(threw);
  assert(breaker.CurrentState() == CircuitBreaker::State::kOpen);

  now += 1000ms;
  breaker.Call([&] { ++calls; });
  assert(calls == 1);
  assert(breaker.CurrentState() == CircuitBreaker::State::kClosed);
}

void TestCircuitBreakerIgnoresAnswers() {
  CircuitBreaker breaker("engine", 1, 1000ms);
  bool           threw = false;
  try {
    breaker.Call([] { throw coordinator::util::NotFound("no such workflow"); });
  } catch (const coordinator::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(breaker.CurrentState() == CircuitBreaker::State::kClosed);
  assert(breaker.Call([] { return std::string("ok"); }) == "ok");
}

void TestPeriodicTaskRunsUntilStopped() {
  std::atomic<int>                       runs{0};
  coordinator::scheduling::PeriodicTask task("tick", 5ms, [&] {
    if (++runs == 2) throw std::runtime_error("one bad tick");
  });
  task.Start();
  assert(task.Running());
  assert(WaitFor([&] { return runs >= 4; }));
  task.Stop();
  assert(!task.Running());

  const int after = runs;
  std::this_thread::sleep_for(20ms);
  assert(runs == after);
}

} // namespace

int main() {
  TestWorkerPoolRunsAndDrains();
  TestWorkerPoolCapacity();
  TestTimerFiresAfterDelay();
  TestTimerLongerThanOneRevolution();
  TestTimerCancelAndReplace();
  TestTimerSurvivesSaturatedPool();
  TestTimerCallbacksRunOnPool();
  TestStatusPollerStopsWhenPollSaysDone();
  TestStatusPollerUntrack();
  TestBackoffDelays();
  TestRetryOnlyRetriesTransientErrors();
  TestRetryOptionsFromConfig();
  TestCircuitBreakerTransitions();
  TestCircuitBreakerIgnoresAnswers();
  TestPeriodicTaskRunsUntilStopped();

  std::cout << "coordinator_unit_scheduling: pass\n";
  return 0;
}
