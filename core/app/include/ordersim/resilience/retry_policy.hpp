#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace ordersim {

class CircuitBreaker;

struct RetryConfig {
  std::uint32_t max_retries{3};  // Attempts after the first
  std::chrono::milliseconds initial_backoff{1000};
  double multiplier{2.0};
  std::chrono::milliseconds max_backoff{30000};
};

// -----------------------------------------------------------------------------
// RetryPolicy — exponential backoff around a fallible call
// -----------------------------------------------------------------------------
//
// @brief  Runs an operation up to 1 + max_retries times, sleeping
//         initial_backoff * multiplier^(n-1) (capped at max_backoff) before
//         the n-th retry.
//
// @details
// When a CircuitBreaker is supplied, run() refuses to start while the
// breaker is open, records a success on the first successful attempt and a
// single failure once every attempt has failed.
//
// The Sleeper is injectable so tests can record backoffs instead of
// waiting.
//
// Thread model:
//   Stateless apart from its config; run() may be called concurrently.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using Operation = std::function<bool()>;

  explicit RetryPolicy(RetryConfig config = {}, Sleeper sleeper = {});

  // Delay before retry number `retry` (1-based). 0 for retry 0.
  std::chrono::milliseconds backoffFor(std::uint32_t retry) const;

  // -------------------------------------------------------------------------
  // run(operation, breaker)
  // -------------------------------------------------------------------------
  // @return true if some attempt returned true; false if the breaker
  //         refused or every attempt failed.
  //
  // @details
  // Exceptions thrown by `operation` are not caught.
  // -------------------------------------------------------------------------
  bool run(const Operation& operation, CircuitBreaker* breaker = nullptr) const;

  const RetryConfig& config() const { return config_; }

 private:
  RetryConfig config_;
  Sleeper sleeper_;
};

}  // namespace ordersim
