#pragma once

#include <cstdint>
#include <string>

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-symbol netted exposure
// -----------------------------------------------------------------------------
//
// @brief  Signed quantity, entry cost and PnL for one instrument.
//
// @details
// Sign convention for quantity:
//   positive → long, negative → short, zero → flat
//
// average_entry_price is the quantity-weighted entry of the current leg. It
// is meaningless (and kept at 0) while flat. After a reversal it restarts at
// the price of the fill that flipped the position.
//
// realized_pnl accumulates closed-leg PnL minus every commission paid on the
// symbol, so a flat position's realized_pnl is its full net result.
//
// unrealized_pnl is not maintained incrementally. PositionManager fills it in
// on each snapshot from the latest mark: (mark - average_entry_price) *
// quantity.
//
// The record survives going flat so historical PnL stays reportable.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double quantity{0.0};              // Signed: +long, -short, 0=flat
  double average_entry_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};        // Snapshot-only, see above
  double total_commission{0.0};
  double last_price{0.0};            // Mark used for unrealized_pnl
  std::int64_t opened_at_ms{0};      // First fill of the current leg
  std::int64_t updated_at_ms{0};

  bool isFlat() const { return quantity == 0.0; }
};

}  // namespace domain
}  // namespace ordersim
