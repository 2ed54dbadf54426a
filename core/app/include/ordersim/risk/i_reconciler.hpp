#pragma once

#include "ordersim/domain/order.hpp"
#include "ordersim/domain/position.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// IReconciler — source of state to resume from
// -----------------------------------------------------------------------------
//
// @brief  Supplies the open orders, positions and (optionally) cash a
//         Backtester starts from instead of an empty book and flat
//         positions.
//
// @details
// Backtester::restore() calls every method exactly once, synchronously,
// before the first candle is processed. Implementations read a checkpoint
// file (CheckpointReconciler), a fixed fixture (StaticReconciler) or, for a
// live session, whatever holds the authoritative state.
//
// Thread model:
//   Not thread-safe. Called from the thread driving the Backtester.
//
// Ownership:
//   The Backtester does not own the reconciler; it uses it only for the
//   duration of restore().
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  // -------------------------------------------------------------------------
  // reconcilePositions()
  // -------------------------------------------------------------------------
  // @return Positions to hydrate into the PositionManager. Empty means flat.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Position> reconcilePositions() = 0;

  // -------------------------------------------------------------------------
  // reconcileOrders()
  // -------------------------------------------------------------------------
  // @return Open (Working or PartiallyFilled) orders to hydrate into their
  //         symbol's OrderBook with their original id and sequence number.
  //
  // @details
  // Terminal orders in the result make restore() throw; the reconciler is
  // responsible for filtering them out.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Order> reconcileOrders() = 0;

  // Cash balance to resume with, or nullopt to keep the configured
  // initial capital.
  virtual std::optional<double> reconcileCash() { return std::nullopt; }
};

// -----------------------------------------------------------------------------
// StaticReconciler — fixed state handed in at construction
// -----------------------------------------------------------------------------
// Used by tests and by drivers that assemble the starting state themselves.
// -----------------------------------------------------------------------------
class StaticReconciler : public IReconciler {
 public:
  StaticReconciler(std::vector<domain::Position> positions,
                   std::vector<domain::Order> orders,
                   std::optional<double> cash = std::nullopt)
      : positions_(std::move(positions)),
        orders_(std::move(orders)),
        cash_(cash) {}

  std::vector<domain::Position> reconcilePositions() override {
    return positions_;
  }

  std::vector<domain::Order> reconcileOrders() override { return orders_; }

  std::optional<double> reconcileCash() override { return cash_; }

 private:
  std::vector<domain::Position> positions_;
  std::vector<domain::Order> orders_;
  std::optional<double> cash_;
};

}  // namespace ordersim
