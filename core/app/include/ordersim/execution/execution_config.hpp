#pragma once

#include <optional>

namespace ordersim {

// -----------------------------------------------------------------------------
// ExecutionConfig — fill-model parameters
// -----------------------------------------------------------------------------
// slippage               fraction applied against market orders at the open
//                        (buy pays open * (1 + s), sell gets open * (1 - s))
// maker_commission_rate  charged on fills of resting limits at their own price
// taker_commission_rate  charged on every other fill
// volume_cap_fraction    per-bar cap on quantity matched at one price level,
//                        as a fraction of bar volume; empty = unlimited
// -----------------------------------------------------------------------------
struct ExecutionConfig {
  double slippage{0.001};
  double maker_commission_rate{0.0004};
  double taker_commission_rate{0.0006};
  std::optional<double> volume_cap_fraction;
};

}  // namespace ordersim
