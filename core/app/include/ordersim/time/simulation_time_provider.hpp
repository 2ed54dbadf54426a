#pragma once

#include "ordersim/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace ordersim {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — bar-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the last processed bar said.
//
// @details
// Backtester::onCandle() calls advance_time(candle.datetime_ms) before the
// fill pass. From then until the next bar every component that asks for the
// time (order submission stamps, Day/GTD expiry, event timestamps) sees that
// bar's time. No look-ahead, and identical data gives identical timestamps.
//
// advance_time() rejects nothing: the driver enforces strictly increasing
// timestamps per symbol before it gets here, and tests are free to set
// arbitrary times.
//
// Thread model:
//   std::atomic<int64_t>, so a gateway thread may read while the backtest
//   thread writes. Within one backtest both happen on the same thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Convenience for cool-down tests.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace ordersim
