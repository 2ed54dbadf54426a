#include "ordersim/resilience/retry_policy.hpp"
#include "ordersim/resilience/circuit_breaker.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <utility>

namespace ordersim {

RetryPolicy::RetryPolicy(RetryConfig config, Sleeper sleeper)
    : config_(config), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }
}

std::chrono::milliseconds RetryPolicy::backoffFor(std::uint32_t retry) const {
  if (retry == 0) {
    return std::chrono::milliseconds{0};
  }
  const double scaled =
      static_cast<double>(config_.initial_backoff.count()) *
      std::pow(config_.multiplier, static_cast<double>(retry - 1));
  const double capped =
      std::min(scaled, static_cast<double>(config_.max_backoff.count()));
  return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

bool RetryPolicy::run(const Operation& operation,
                      CircuitBreaker* breaker) const {
  if (breaker != nullptr && !breaker->allowRequest()) {
    std::cerr << "[RetryPolicy] Circuit breaker open, not attempting\n";
    return false;
  }

  const std::uint32_t attempts = config_.max_retries + 1;
  for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      sleeper_(backoffFor(attempt));
    }
    if (operation()) {
      if (breaker != nullptr) {
        breaker->recordSuccess();
      }
      return true;
    }
    std::cerr << "[RetryPolicy] Attempt " << (attempt + 1) << "/" << attempts
              << " failed\n";
  }

  if (breaker != nullptr) {
    breaker->recordFailure();
  }
  return false;
}

}  // namespace ordersim
