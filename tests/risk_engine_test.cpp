// =============================================================================
// risk_engine_test.cpp
// =============================================================================
// Unit tests for ordersim::RiskEngine.
//
// Validates:
//   - Position limit counts current position, pending orders and the request
//   - Reducing requests pass even near the limit
//   - Drawdown floor publishes a RiskViolationEvent once and halts trading
//   - External RiskViolationEvents and haltTrading() halt trading
//   - Destructor unsubscribes from the bus
//
// Design: Single-threaded. The PositionManager is fed directly and the
// resulting PositionUpdateEvents are published by hand, the way the
// Backtester does after each fill.
// =============================================================================

#include "ordersim/domain/fill.hpp"
#include "ordersim/domain/order_request.hpp"
#include "ordersim/domain/risk_limits.hpp"
#include "ordersim/eventbus/event_bus.hpp"
#include "ordersim/events/event.hpp"
#include "ordersim/portfolio/position_manager.hpp"
#include "ordersim/risk/risk_engine.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <vector>

using ordersim::EventBus;
using ordersim::PositionManager;
using ordersim::PositionUpdateEvent;
using ordersim::RiskEngine;
using ordersim::RiskViolationEvent;
using ordersim::domain::OrderRequest;
using ordersim::domain::RejectReason;
using ordersim::domain::Side;

class RiskEngineTest : public ::testing::Test {
 protected:
  static ordersim::domain::RiskLimits limits() {
    ordersim::domain::RiskLimits l;
    l.max_position_per_symbol = 10.0;
    l.max_drawdown = -50.0;
    return l;
  }

  EventBus bus;
  PositionManager positions;
  RiskEngine risk{bus, positions, limits()};

  // Nets a fill and publishes the update like the Backtester does.
  void fill(Side side, double qty, double price) {
    ordersim::domain::Fill f;
    f.order_id = 1;
    f.symbol = "BTCUSDT";
    f.side = side;
    f.quantity = qty;
    f.price = price;
    PositionUpdateEvent update;
    update.position = positions.apply(f);
    bus.publish(update);
  }

  static OrderRequest buy(double qty) {
    return OrderRequest::market("BTCUSDT", Side::Buy, qty);
  }
  static OrderRequest sell(double qty) {
    return OrderRequest::market("BTCUSDT", Side::Sell, qty);
  }
};

// -----------------------------------------------------------------------------
// 1. A request within the limit passes; one past it is rejected.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, PositionLimitOnFreshSymbol) {
  EXPECT_FALSE(risk.check(buy(10.0), 0.0));
  EXPECT_EQ(risk.check(buy(10.5), 0.0), RejectReason::PositionLimitExceeded);
  EXPECT_EQ(risk.check(sell(11.0), 0.0), RejectReason::PositionLimitExceeded);
}

// -----------------------------------------------------------------------------
// 2. Pending same-side orders count toward the limit.
// Why: Without them a strategy could stack resting buys that, once filled
//      together, blow far past the limit.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, PendingOrdersCount) {
  fill(Side::Buy, 4.0, 100.0);

  EXPECT_FALSE(risk.check(buy(3.0), 3.0));
  EXPECT_EQ(risk.check(buy(3.0), 4.0), RejectReason::PositionLimitExceeded);
}

// -----------------------------------------------------------------------------
// 3. A reducing request is allowed even when the position is at the limit.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, ReducingRequestPasses) {
  fill(Side::Buy, 10.0, 100.0);

  EXPECT_EQ(risk.check(buy(1.0), 0.0), RejectReason::PositionLimitExceeded);
  EXPECT_FALSE(risk.check(sell(5.0), 0.0));
  EXPECT_FALSE(risk.check(sell(20.0), 0.0));
  EXPECT_EQ(risk.check(sell(20.5), 0.0), RejectReason::PositionLimitExceeded);
}

// -----------------------------------------------------------------------------
// 4. Realized PnL below the floor publishes one violation and halts.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, DrawdownHaltsTrading) {
  std::vector<RiskViolationEvent> violations;
  bus.subscribe<RiskViolationEvent>(
      [&violations](const RiskViolationEvent& e) { violations.push_back(e); });

  fill(Side::Buy, 1.0, 100.0);
  fill(Side::Sell, 1.0, 60.0);   // realized -40: above the floor
  EXPECT_FALSE(risk.isHalted());
  EXPECT_TRUE(violations.empty());

  fill(Side::Buy, 1.0, 100.0);
  fill(Side::Sell, 1.0, 80.0);   // realized -60: below -50

  EXPECT_TRUE(risk.isHalted());
  ASSERT_EQ(violations.size(), 1u);
  EXPECT_EQ(violations[0].symbol, "BTCUSDT");
  EXPECT_DOUBLE_EQ(violations[0].current_value, -60.0);
  EXPECT_DOUBLE_EQ(violations[0].limit_value, -50.0);

  EXPECT_EQ(risk.check(sell(1.0), 0.0), RejectReason::TradingHalted);

  // Further losses do not publish again.
  fill(Side::Buy, 1.0, 100.0);
  fill(Side::Sell, 1.0, 90.0);
  EXPECT_EQ(violations.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4b. The violation gets a fresh sequence number from the owner's source,
//     never the one of the position update that triggered it.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, ViolationTakesSequenceFromOwner) {
  EventBus owned_bus;
  PositionManager owned_positions;
  std::uint64_t next_seq = 100;
  RiskEngine owned{owned_bus, owned_positions, limits(),
                   [&next_seq] { return next_seq++; }};

  std::vector<RiskViolationEvent> violations;
  owned_bus.subscribe<RiskViolationEvent>(
      [&violations](const RiskViolationEvent& e) { violations.push_back(e); });

  ordersim::domain::Fill f;
  f.order_id = 1;
  f.symbol = "BTCUSDT";
  f.side = Side::Buy;
  f.quantity = 1.0;
  f.price = 100.0;
  owned_positions.apply(f);
  f.side = Side::Sell;
  f.price = 40.0;

  PositionUpdateEvent update;
  update.position = owned_positions.apply(f);
  update.sequence_id = next_seq++;
  owned_bus.publish(update);

  ASSERT_EQ(violations.size(), 1u);
  EXPECT_EQ(update.sequence_id, 100u);
  EXPECT_EQ(violations[0].sequence_id, 101u);
  EXPECT_EQ(next_seq, 102u);
}

// -----------------------------------------------------------------------------
// 5. A violation published by anyone else also halts trading.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, ExternalViolationHalts) {
  RiskViolationEvent external;
  external.symbol = "ETHUSDT";
  external.reason = "Exchange kill switch";
  bus.publish(external);

  EXPECT_TRUE(risk.isHalted());
  EXPECT_EQ(risk.check(buy(1.0), 0.0), RejectReason::TradingHalted);
}

TEST_F(RiskEngineTest, ManualHalt) {
  risk.haltTrading();
  EXPECT_TRUE(risk.isHalted());
  EXPECT_EQ(risk.check(buy(1.0), 0.0), RejectReason::TradingHalted);
}

// -----------------------------------------------------------------------------
// 6. Destroying the engine removes both subscriptions.
// Why: The bus outlives the engine in the Backtester's member order; a
//      dangling callback would crash on the next publish.
// -----------------------------------------------------------------------------
TEST(RiskEngineLifetimeTest, DestructorUnsubscribes) {
  EventBus bus;
  PositionManager positions;
  {
    RiskEngine risk(bus, positions, ordersim::domain::RiskLimits{});
    EXPECT_EQ(bus.subscriberCount(), 2u);
  }
  EXPECT_EQ(bus.subscriberCount(), 0u);
  bus.publish(RiskViolationEvent{});
}
