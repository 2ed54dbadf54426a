#include "ordersim/domain/reject_reason.hpp"

namespace ordersim {
namespace domain {

const char* toString(RejectReason reason) {
  using R = RejectReason;
  switch (reason) {
    case R::NonPositiveQuantity:   return "NON_POSITIVE_QUANTITY";
    case R::NonFiniteQuantity:     return "NON_FINITE_QUANTITY";
    case R::MissingLimitPrice:     return "MISSING_LIMIT_PRICE";
    case R::NonPositiveLimitPrice: return "NON_POSITIVE_LIMIT_PRICE";
    case R::MissingStopPrice:      return "MISSING_STOP_PRICE";
    case R::NonPositiveStopPrice:  return "NON_POSITIVE_STOP_PRICE";
    case R::MissingExpiry:         return "MISSING_EXPIRY";
    case R::SymbolMismatch:        return "SYMBOL_MISMATCH";
    case R::PositionLimitExceeded: return "POSITION_LIMIT_EXCEEDED";
    case R::TradingHalted:         return "TRADING_HALTED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace ordersim
