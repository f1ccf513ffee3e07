#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "config/config.pb.h"

namespace coordinator::scheduling {

RetryOptions RetryOptions::FromConfig(const coordinator::runtime::config::RetryConfig& config, RetryOptions defaults) {
  RetryOptions options = defaults;
  if (config.max_attempts() > 0) options.max_attempts = config.max_attempts();
  if (config.initial_backoff_ms() > 0) options.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  if (config.max_backoff_ms() > 0) options.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  if (config.multiplier() > 0) options.multiplier = config.multiplier();
  return options;
}

std::chrono::milliseconds BackoffDelay(const RetryOptions& options, uint32_t attempt) {
  const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
  const double delay    = static_cast<double>(options.initial_backoff.count()) * std::pow(options.multiplier, exponent);
  const double capped   = std::min(delay, static_cast<double>(options.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

RetryPolicy::RetryPolicy(RetryOptions options, Sleeper sleeper) : options_(options), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

} // namespace coordinator::scheduling
