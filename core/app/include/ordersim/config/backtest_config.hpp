#pragma once

#include "ordersim/domain/risk_limits.hpp"
#include "ordersim/execution/execution_config.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace ordersim {

// -----------------------------------------------------------------------------
// BacktestConfig — everything one Backtester run is parameterized by
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct parsed from JSON. Copied into each Backtester,
//         so parallel runs with different configs share nothing.
//
// @details
// JSON layout (every key optional, defaults as initialized below):
//
//   {
//     "initial_capital": 100000.0,
//     "history_window": 300,
//     "execution": { "slippage": 0.001,
//                    "maker_commission_rate": 0.0004,
//                    "taker_commission_rate": 0.0006,
//                    "volume_cap_fraction": null },
//     "risk":      { "max_position_per_symbol": 1000.0,
//                    "max_drawdown": -500.0 },
//     "strategy":  { "name": "grid", "params": { ... } }
//   }
//
// strategy.params is kept as raw JSON and interpreted by the
// StrategyRegistry factory for strategy.name.
// -----------------------------------------------------------------------------
struct BacktestConfig {
  double initial_capital{100000.0};
  std::size_t history_window{300};   // Candles kept per symbol for strategies
  ExecutionConfig execution;
  domain::RiskLimits risk;
  std::string strategy_name{"grid"};
  nlohmann::json strategy_params = nlohmann::json::object();
};

// -------------------------------------------------------------------------
// parseBacktestConfig(json)
// -------------------------------------------------------------------------
// @throws ConfigError on a non-object document, a value of the wrong type,
//         negative slippage or commission, volume_cap_fraction outside
//         (0, 1], non-positive initial_capital or history_window, or a
//         positive max_drawdown.
// -------------------------------------------------------------------------
BacktestConfig parseBacktestConfig(const nlohmann::json& document);

// Reads and parses a JSON file. Throws ConfigError if it cannot be opened
// or parsed.
BacktestConfig loadBacktestConfig(const std::string& path);

nlohmann::json toJson(const BacktestConfig& config);

}  // namespace ordersim
