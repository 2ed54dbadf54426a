#pragma once

#include "ordersim/strategy/i_strategy.hpp"

#include <cstddef>
#include <string>

namespace ordersim {

struct GridParams {
  std::size_t levels{3};   // Buy limits laid below the close
  double spacing{0.01};    // Fractional distance between levels
  double quantity{1.0};    // Per level
};

// -----------------------------------------------------------------------------
// GridStrategy
// -----------------------------------------------------------------------------
// Lays a ladder of `levels` limit buys at close * (1 - k * spacing) whenever
// the symbol has no open buy, and while long keeps one limit sell for the
// whole position at average_entry_price * (1 + spacing). Profits from price
// oscillating around the close.
// -----------------------------------------------------------------------------
class GridStrategy : public IStrategy {
 public:
  explicit GridStrategy(GridParams params);

  std::string name() const override { return "grid"; }

  StrategyDecision onBar(const StrategyContext& context) override;

  const GridParams& params() const { return params_; }

 private:
  GridParams params_;
};

}  // namespace ordersim
