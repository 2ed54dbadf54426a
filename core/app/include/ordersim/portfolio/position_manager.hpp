#pragma once

#include "ordersim/domain/fill.hpp"
#include "ordersim/domain/position.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// PositionManager — per-symbol position netting and PnL
// -----------------------------------------------------------------------------
//
// @brief  Folds fills into one netted Position per symbol and keeps the
//         latest mark price for unrealized PnL.
//
// @details
// apply() distinguishes three cases for a fill of signed quantity f against
// a current signed quantity q with average entry a:
//
//   1. Increasing (q == 0 or sign(f) == sign(q)):
//        a' = (|q| * a + |f| * p) / (|q| + |f|),   q' = q + f
//   2. Reducing (opposite sign, |f| <= |q|):
//        realized += |f| * (p - a) * sign(q),      a unchanged
//        q' == 0 resets a to 0
//   3. Reversing (opposite sign, |f| > |q|):
//        realized += |q| * (p - a) * sign(q)
//        q' = q + f, a' = p, opened_at_ms restarts
//
// Every fill also subtracts its commission from realized_pnl and adds it to
// total_commission. A resulting |q'| <= kQuantityEpsilon snaps to exactly 0.
//
// Each fill computes the new Position on a copy and commits it with a single
// assignment, so a Position is never observed half-updated.
//
// Thread model:
//   Single-threaded. Owned and driven by one Backtester; parallel runs own
//   separate managers.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  PositionManager() = default;

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;

  // -------------------------------------------------------------------------
  // apply(fill)
  // -------------------------------------------------------------------------
  // @brief  Nets one fill into its symbol's position.
  //
  // @return Snapshot of the position after the fill, with unrealized_pnl
  //         computed against the fill price.
  //
  // @details
  // The fill price also becomes the symbol's mark until the next
  // markPrice() call.
  // -------------------------------------------------------------------------
  domain::Position apply(const domain::Fill& fill);

  // Sets the mark used for unrealized PnL (normally the bar close).
  void markPrice(const std::string& symbol, double price);

  // Snapshot for `symbol`; a flat, zeroed position for unknown symbols.
  domain::Position position(const std::string& symbol) const;

  // Snapshots of every symbol ever traded or hydrated, ordered by symbol.
  std::vector<domain::Position> positions() const;

  double totalRealizedPnl() const;
  double totalUnrealizedPnl() const;

  // Sum of quantity * mark over all symbols.
  double marketValue() const;

  // -------------------------------------------------------------------------
  // hydratePosition(position)
  // -------------------------------------------------------------------------
  // @brief  Replaces the position of position.symbol, used when restoring a
  //         checkpoint. last_price seeds the mark.
  // -------------------------------------------------------------------------
  void hydratePosition(const domain::Position& position);

  // -------------------------------------------------------------------------
  // netFill(current, fill)
  // -------------------------------------------------------------------------
  // @brief  The netting math on its own: returns the position that results
  //         from applying `fill` to `current`. No side effects.
  // -------------------------------------------------------------------------
  static domain::Position netFill(const domain::Position& current,
                                  const domain::Fill& fill);

 private:
  domain::Position withMark(const domain::Position& position) const;

  std::map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, double> marks_;
};

}  // namespace ordersim
