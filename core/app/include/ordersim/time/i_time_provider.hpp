#pragma once

#include <cstdint>

namespace ordersim {

// -----------------------------------------------------------------------------
// ITimeProvider — injected clock
// -----------------------------------------------------------------------------
//
// @brief  "What time is it" behind an interface, in epoch milliseconds.
//
// @details
// The simulation never reads the wall clock. A Backtester owns a
// SimulationTimeProvider that it advances to each bar's timestamp, so
// order timestamps, expiry decisions and event times all follow the data.
//
// The resilience helpers (CircuitBreaker cool-down) take the same interface:
// the candle feed gateway hands them a LiveTimeProvider, tests hand them a
// SimulationTimeProvider and step it by hand.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls.
//
// Ownership:
//   Consumers hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. 0 before a simulated clock has been advanced.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace ordersim
