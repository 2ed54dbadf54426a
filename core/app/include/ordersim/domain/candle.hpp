#pragma once

#include <cstdint>
#include <optional>

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// Candle — one OHLCV bar
// -----------------------------------------------------------------------------
// datetime_ms is the bar's open time in epoch milliseconds. A well-formed bar
// satisfies low <= {open, close} <= high with every price finite and
// positive and volume >= 0.
// -----------------------------------------------------------------------------
struct Candle {
  std::int64_t datetime_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// -----------------------------------------------------------------------------
// CandleError — data-integrity failure for one bar
// -----------------------------------------------------------------------------
// OutOfOrder is raised by the driver, not by validateCandle(): it needs the
// previous timestamp for the symbol.
// -----------------------------------------------------------------------------
enum class CandleError {
  NonFinitePrice,
  NonPositivePrice,
  HighBelowLow,
  OpenOutsideRange,
  CloseOutsideRange,
  InvalidVolume,
  OutOfOrder,
};

// -------------------------------------------------------------------------
// validateCandle(candle)
// -------------------------------------------------------------------------
// @brief  Rejects malformed bars. Nothing is repaired or clamped.
//
// @return std::nullopt for a well-formed candle, otherwise the first
//         failing check.
// -------------------------------------------------------------------------
std::optional<CandleError> validateCandle(const Candle& candle);

const char* toString(CandleError error);

}  // namespace domain
}  // namespace ordersim
