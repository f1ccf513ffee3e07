#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::runtime::config {
class RetryConfig;
}

namespace coordinator::scheduling {

struct RetryOptions {
  uint32_t                  max_attempts{3};
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{5000};
  double                    multiplier{2.0};

  // Zero fields in config keep the values of `defaults`.
  static RetryOptions FromConfig(const coordinator::runtime::config::RetryConfig& config);
  static RetryOptions FromConfig(const coordinator::runtime::config::RetryConfig& config, RetryOptions defaults);
};

inline RetryOptions RetryOptions::FromConfig(const coordinator::runtime::config::RetryConfig& config) {
  return FromConfig(config, RetryOptions{});
}

// Delay before retry number `attempt` (1-based): initial * multiplier^(attempt-1), capped.
std::chrono::milliseconds BackoffDelay(const RetryOptions& options, uint32_t attempt);

/*
  Retries TransientInfraError with exponential backoff. Any other
  exception is not retryable and propagates on the first throw. After the
  last attempt the transient error is rethrown to the caller.
*/
class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit RetryPolicy(RetryOptions options, Sleeper sleeper = {});

  const RetryOptions& Options() const {
    return options_;
  }

  template <typename Fn>
  auto Execute(std::string_view operation, Fn&& fn, uint32_t* attempts = nullptr) const -> decltype(fn()) {
    const uint32_t max_attempts = options_.max_attempts == 0 ? 1 : options_.max_attempts;
    for (uint32_t attempt = 1;; ++attempt) {
      if (attempts) *attempts = attempt;
      try {
        return fn();
      } catch (const util::TransientInfraError& e) {
        if (attempt >= max_attempts) {
          throw;
        }
        const auto delay = BackoffDelay(options_, attempt);
        COORDINATOR_LOG_WARN("transient failure, retrying",
                             {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                              observability::IntField("backoff_ms", delay.count()), observability::StringField("error", e.what())});
        sleeper_(delay);
      }
    }
  }

 private:
  RetryOptions options_;
  Sleeper      sleeper_;
};

} // namespace coordinator::scheduling
