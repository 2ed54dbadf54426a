#pragma once

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — per-run hard thresholds
// -----------------------------------------------------------------------------
//
// @brief  Pre-trade sizing limit and post-trade kill-switch floor, loaded
//         from the "risk" section of the backtest configuration.
//
// @details
// max_position_per_symbol bounds |position + same-side open orders + new
// request| for a symbol. A request that would exceed it is rejected with
// PositionLimitExceeded.
//
// max_drawdown is a NEGATIVE realized-PnL floor. When any symbol's
// realized_pnl falls below it the RiskEngine publishes a RiskViolationEvent
// and rejects every later request with TradingHalted.
//
// Copied by value into each Backtester; parallel runs never share one.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_position_per_symbol{1000.0};
  double max_drawdown{-500.0};
};

}  // namespace domain
}  // namespace ordersim
