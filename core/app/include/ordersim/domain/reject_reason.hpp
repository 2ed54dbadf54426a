#pragma once

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason
// -----------------------------------------------------------------------------
// Why an order request never reached the book. Validation reasons come from
// validateOrder(); PositionLimitExceeded and TradingHalted come from the
// RiskEngine pre-trade check.
// -----------------------------------------------------------------------------
enum class RejectReason {
  NonPositiveQuantity,
  NonFiniteQuantity,
  MissingLimitPrice,
  NonPositiveLimitPrice,
  MissingStopPrice,
  NonPositiveStopPrice,
  MissingExpiry,
  SymbolMismatch,
  PositionLimitExceeded,
  TradingHalted,
};

const char* toString(RejectReason reason);

}  // namespace domain
}  // namespace ordersim
