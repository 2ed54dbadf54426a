#pragma once

#include "ordersim/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>

namespace ordersim {

enum class CircuitState {
  Closed,    // Calls pass through
  Open,      // Calls short-circuit until open_timeout_ms has elapsed
  HalfOpen,  // Probing: calls pass, one failure reopens
};

const char* toString(CircuitState state);

struct CircuitBreakerConfig {
  std::uint32_t failure_threshold{5};  // Consecutive failures to open
  std::uint32_t success_threshold{2};  // Consecutive HalfOpen successes to close
  std::int64_t open_timeout_ms{60000}; // Cool-down before probing
};

// -----------------------------------------------------------------------------
// CircuitBreaker
// -----------------------------------------------------------------------------
//
// @brief  Stops calling a failing collaborator (feed socket, exchange client)
//         for a cool-down window, then probes it before resuming.
//
// @details
//   Closed   --failure_threshold consecutive failures-->  Open
//   Open     --open_timeout_ms elapsed, on allowRequest()-->  HalfOpen
//   HalfOpen --success_threshold consecutive successes-->  Closed
//   HalfOpen --any failure-->  Open
//
// A success in Closed resets the failure count. Time comes from the injected
// ITimeProvider so tests drive the cool-down with a SimulationTimeProvider.
//
// Never used by the simulation core; it guards network collaborators only.
//
// Thread model:
//   All methods lock an internal mutex and may be called from any thread.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  explicit CircuitBreaker(const ITimeProvider& clock,
                          CircuitBreakerConfig config = {});

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // True if a call may be attempted now. Moves Open -> HalfOpen once the
  // cool-down has elapsed.
  bool allowRequest();

  void recordSuccess();
  void recordFailure();

  // Back to Closed with all counters cleared.
  void reset();

  CircuitState state() const;
  std::uint32_t failureCount() const;

 private:
  const ITimeProvider& clock_;
  const CircuitBreakerConfig config_;

  mutable std::mutex mutex_;  // Protects everything below
  CircuitState state_{CircuitState::Closed};
  std::uint32_t failure_count_{0};
  std::uint32_t success_count_{0};
  std::int64_t opened_at_ms_{0};
};

}  // namespace ordersim
