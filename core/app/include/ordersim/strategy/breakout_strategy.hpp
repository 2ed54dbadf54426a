#pragma once

#include "ordersim/strategy/i_strategy.hpp"

#include <cstddef>
#include <string>

namespace ordersim {

struct BreakoutParams {
  std::size_t lookback{20};  // Bars in the breakout window
  double quantity{1.0};
  double stop_loss{0.02};    // Protective stop distance below entry
  // Higher timeframe whose last bar must have closed above its open before
  // an entry is armed. Empty: no trend filter.
  std::string trend_timeframe;
};

// -----------------------------------------------------------------------------
// BreakoutStrategy
// -----------------------------------------------------------------------------
//
// @brief  Enters long on a break of the recent high and protects the
//         position with a stop.
//
// @details
// While flat: keeps exactly one stop buy at the highest high of the last
// `lookback` bars. When the window high moves, the old stop is cancelled and
// a new one placed.
//
// While long: cancels any remaining entry stop and keeps one stop sell for
// the full position at average_entry_price * (1 - stop_loss).
//
// With a trend_timeframe, the entry stop is only kept while the latest bar
// of that timeframe closed above its open; otherwise any entry is cancelled.
// A timeframe that has not been fed yet counts as no trend.
//
// Does nothing until the window is full.
// -----------------------------------------------------------------------------
class BreakoutStrategy : public IStrategy {
 public:
  explicit BreakoutStrategy(BreakoutParams params);

  std::string name() const override { return "breakout"; }

  StrategyDecision onBar(const StrategyContext& context) override;

  const BreakoutParams& params() const { return params_; }

 private:
  bool trendAllowsEntry(const StrategyContext& context) const;

  BreakoutParams params_;
};

}  // namespace ordersim
