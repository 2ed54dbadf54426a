// =============================================================================
// position_manager_test.cpp
// =============================================================================
// Unit tests for ordersim::PositionManager.
//
// Validates:
//   - Opening and increasing a position (weighted average entry)
//   - Reducing and closing (realized PnL, average unchanged, reset on flat)
//   - Reversal in one fill (realized on the closed leg, new entry price)
//   - Commission accounting in realized_pnl and total_commission
//   - Shorts mirror longs
//   - Marks and unrealized PnL, market value, hydration
//   - Position conservation: quantity == sum of signed fills
// =============================================================================

#include "ordersim/domain/fill.hpp"
#include "ordersim/domain/position.hpp"
#include "ordersim/portfolio/position_manager.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using ordersim::PositionManager;
using ordersim::domain::Fill;
using ordersim::domain::Position;
using ordersim::domain::Side;

namespace {

Fill makeFill(const std::string& symbol, Side side, double qty, double price,
              double commission = 0.0, std::int64_t ts = 1000) {
  Fill f;
  f.order_id = 1;
  f.symbol = symbol;
  f.side = side;
  f.quantity = qty;
  f.price = price;
  f.commission = commission;
  f.timestamp_ms = ts;
  return f;
}

}  // namespace

class PositionManagerTest : public ::testing::Test {
 protected:
  PositionManager manager;
};

// -----------------------------------------------------------------------------
// 1. Opening then adding moves the average entry to the weighted mean.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, IncreasingAveragesEntry) {
  manager.apply(makeFill("BTC", Side::Buy, 1.0, 100.0, 0.0, 1000));
  Position pos = manager.apply(makeFill("BTC", Side::Buy, 3.0, 104.0, 0.0, 2000));

  EXPECT_DOUBLE_EQ(pos.quantity, 4.0);
  EXPECT_DOUBLE_EQ(pos.average_entry_price, (100.0 + 3.0 * 104.0) / 4.0);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 0.0);
  EXPECT_EQ(pos.opened_at_ms, 1000);
  EXPECT_EQ(pos.updated_at_ms, 2000);
}

// -----------------------------------------------------------------------------
// 2. Round trip: realized = exit - entry - commissions, flat afterwards.
// Why: The headline accounting identity. A flat position's realized_pnl is
//      its full net result.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, RoundTripRealizesNetPnl) {
  manager.apply(makeFill("BTC", Side::Buy, 1.0, 100.0, 0.06));
  Position pos = manager.apply(makeFill("BTC", Side::Sell, 1.0, 110.0, 0.066));

  EXPECT_TRUE(pos.isFlat());
  EXPECT_DOUBLE_EQ(pos.quantity, 0.0);
  EXPECT_DOUBLE_EQ(pos.average_entry_price, 0.0);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 10.0 - 0.06 - 0.066);
  EXPECT_DOUBLE_EQ(pos.total_commission, 0.06 + 0.066);
  EXPECT_DOUBLE_EQ(pos.unrealized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 3. A partial reduction realizes only the closed part.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ReducingKeepsAverage) {
  manager.apply(makeFill("BTC", Side::Buy, 4.0, 100.0));
  Position pos = manager.apply(makeFill("BTC", Side::Sell, 1.0, 108.0));

  EXPECT_DOUBLE_EQ(pos.quantity, 3.0);
  EXPECT_DOUBLE_EQ(pos.average_entry_price, 100.0);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 8.0);
}

// -----------------------------------------------------------------------------
// 4. A fill larger than the position flips it in one step.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ReversalRestartsLeg) {
  manager.apply(makeFill("BTC", Side::Buy, 2.0, 100.0, 0.0, 1000));
  Position pos =
      manager.apply(makeFill("BTC", Side::Sell, 5.0, 90.0, 0.0, 5000));

  EXPECT_DOUBLE_EQ(pos.quantity, -3.0);
  EXPECT_DOUBLE_EQ(pos.average_entry_price, 90.0);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 2.0 * (90.0 - 100.0));
  EXPECT_EQ(pos.opened_at_ms, 5000);
}

// -----------------------------------------------------------------------------
// 5. Shorts profit when price falls.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ShortRoundTrip) {
  manager.apply(makeFill("ETH", Side::Sell, 2.0, 50.0));
  manager.markPrice("ETH", 45.0);
  EXPECT_DOUBLE_EQ(manager.position("ETH").unrealized_pnl, 10.0);

  Position pos = manager.apply(makeFill("ETH", Side::Buy, 2.0, 45.0));
  EXPECT_TRUE(pos.isFlat());
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 10.0);
}

// -----------------------------------------------------------------------------
// 6. Floating-point residue from partial closes snaps to exactly flat.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ResidueSnapsToFlat) {
  manager.apply(makeFill("BTC", Side::Buy, 0.3, 100.0));
  manager.apply(makeFill("BTC", Side::Sell, 0.1, 100.0));
  manager.apply(makeFill("BTC", Side::Sell, 0.1, 100.0));
  Position pos = manager.apply(makeFill("BTC", Side::Sell, 0.1, 100.0));

  EXPECT_EQ(pos.quantity, 0.0);
  EXPECT_EQ(pos.average_entry_price, 0.0);
}

// -----------------------------------------------------------------------------
// 7. Marks drive unrealized PnL and market value; unknown symbols are flat.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, MarksAndTotals) {
  manager.apply(makeFill("BTC", Side::Buy, 2.0, 100.0));
  manager.apply(makeFill("ETH", Side::Sell, 1.0, 50.0));
  manager.markPrice("BTC", 105.0);
  manager.markPrice("ETH", 40.0);

  EXPECT_DOUBLE_EQ(manager.position("BTC").unrealized_pnl, 10.0);
  EXPECT_DOUBLE_EQ(manager.position("ETH").unrealized_pnl, 10.0);
  EXPECT_DOUBLE_EQ(manager.totalUnrealizedPnl(), 20.0);
  EXPECT_DOUBLE_EQ(manager.marketValue(), 2.0 * 105.0 - 40.0);
  EXPECT_DOUBLE_EQ(manager.position("BTC").last_price, 105.0);

  Position unknown = manager.position("SOL");
  EXPECT_EQ(unknown.symbol, "SOL");
  EXPECT_TRUE(unknown.isFlat());

  std::vector<Position> all = manager.positions();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].symbol, "BTC");
  EXPECT_EQ(all[1].symbol, "ETH");
}

// -----------------------------------------------------------------------------
// 8. Conservation: net quantity equals the sum of signed fills, and realized
//    PnL plus open cost equals the cash flow of the fills.
// Why: Catches drift in the three-way netting branches over a long,
//      irregular fill sequence.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, QuantityAndCashAreConserved) {
  const std::vector<Fill> fills = {
      makeFill("BTC", Side::Buy, 1.0, 100.0, 0.1),
      makeFill("BTC", Side::Buy, 2.0, 102.0, 0.2),
      makeFill("BTC", Side::Sell, 1.5, 105.0, 0.15),
      makeFill("BTC", Side::Sell, 3.0, 99.0, 0.3),
      makeFill("BTC", Side::Buy, 0.5, 97.0, 0.05),
      makeFill("BTC", Side::Buy, 2.0, 98.0, 0.2),
  };

  double signed_total = 0.0;
  double cash_flow = 0.0;
  for (const Fill& f : fills) {
    manager.apply(f);
    signed_total += f.signedQuantity();
    cash_flow += -f.signedQuantity() * f.price - f.commission;
  }

  const Position pos = manager.position("BTC");
  EXPECT_NEAR(pos.quantity, signed_total, 1e-9);
  // Marking at the average entry makes unrealized zero, so the whole cash
  // flow must be realized PnL minus the cost of the open leg.
  EXPECT_NEAR(cash_flow, pos.realized_pnl - pos.quantity * pos.average_entry_price,
              1e-9);
}

// -----------------------------------------------------------------------------
// 9. netFill() is pure: the input position is not modified.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, NetFillIsPure) {
  Position start;
  start.symbol = "BTC";
  start.quantity = 1.0;
  start.average_entry_price = 100.0;

  Position next =
      PositionManager::netFill(start, makeFill("BTC", Side::Buy, 1.0, 110.0));

  EXPECT_DOUBLE_EQ(start.quantity, 1.0);
  EXPECT_DOUBLE_EQ(next.quantity, 2.0);
  EXPECT_DOUBLE_EQ(next.average_entry_price, 105.0);
  EXPECT_TRUE(manager.positions().empty());
}

// -----------------------------------------------------------------------------
// 10. hydratePosition() replaces state and seeds the mark.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, HydrateSeedsMark) {
  Position restored;
  restored.symbol = "BTC";
  restored.quantity = 2.0;
  restored.average_entry_price = 100.0;
  restored.realized_pnl = -3.0;
  restored.last_price = 101.0;

  manager.hydratePosition(restored);

  Position pos = manager.position("BTC");
  EXPECT_DOUBLE_EQ(pos.quantity, 2.0);
  EXPECT_DOUBLE_EQ(pos.unrealized_pnl, 2.0);
  EXPECT_DOUBLE_EQ(manager.totalRealizedPnl(), -3.0);

  pos = manager.apply(makeFill("BTC", Side::Sell, 2.0, 103.0));
  EXPECT_DOUBLE_EQ(pos.realized_pnl, -3.0 + 6.0);
}
