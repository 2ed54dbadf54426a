#include "ordersim/domain/candle.hpp"

#include <cmath>

namespace ordersim {
namespace domain {

std::optional<CandleError> validateCandle(const Candle& candle) {
  const double prices[] = {candle.open, candle.high, candle.low, candle.close};
  for (double p : prices) {
    if (!std::isfinite(p)) {
      return CandleError::NonFinitePrice;
    }
  }
  for (double p : prices) {
    if (p <= 0.0) {
      return CandleError::NonPositivePrice;
    }
  }

  if (candle.high < candle.low) {
    return CandleError::HighBelowLow;
  }
  if (candle.open < candle.low || candle.open > candle.high) {
    return CandleError::OpenOutsideRange;
  }
  if (candle.close < candle.low || candle.close > candle.high) {
    return CandleError::CloseOutsideRange;
  }
  if (!std::isfinite(candle.volume) || candle.volume < 0.0) {
    return CandleError::InvalidVolume;
  }

  return std::nullopt;
}

const char* toString(CandleError error) {
  switch (error) {
    case CandleError::NonFinitePrice:    return "NON_FINITE_PRICE";
    case CandleError::NonPositivePrice:  return "NON_POSITIVE_PRICE";
    case CandleError::HighBelowLow:      return "HIGH_BELOW_LOW";
    case CandleError::OpenOutsideRange:  return "OPEN_OUTSIDE_RANGE";
    case CandleError::CloseOutsideRange: return "CLOSE_OUTSIDE_RANGE";
    case CandleError::InvalidVolume:     return "INVALID_VOLUME";
    case CandleError::OutOfOrder:        return "OUT_OF_ORDER";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace ordersim
