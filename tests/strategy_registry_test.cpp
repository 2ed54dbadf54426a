// =============================================================================
// strategy_registry_test.cpp
// =============================================================================
// Unit tests for ordersim::StrategyRegistry and the built-in strategies.
//
// Validates:
//   - withBuiltins() registers "grid" and "breakout"
//   - create() applies JSON params and rejects bad names / params
//   - Custom entries can be added
//   - GridStrategy ladder and take-profit decisions
//   - BreakoutStrategy entry stop, re-pricing and protective stop
//   - BreakoutStrategy higher-timeframe trend filter
// =============================================================================

#include "ordersim/config/config_error.hpp"
#include "ordersim/domain/candle.hpp"
#include "ordersim/domain/order.hpp"
#include "ordersim/domain/position.hpp"
#include "ordersim/strategy/breakout_strategy.hpp"
#include "ordersim/strategy/grid_strategy.hpp"
#include "ordersim/strategy/i_strategy.hpp"
#include "ordersim/strategy/strategy_registry.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <deque>
#include <memory>
#include <string>
#include <vector>

using ordersim::BreakoutParams;
using ordersim::BreakoutStrategy;
using ordersim::ConfigError;
using ordersim::GridParams;
using ordersim::GridStrategy;
using ordersim::StrategyContext;
using ordersim::StrategyDecision;
using ordersim::StrategyRegistry;
using ordersim::domain::Candle;
using ordersim::domain::Order;
using ordersim::domain::OrderKind;
using ordersim::domain::Position;
using ordersim::domain::Side;

namespace {

// A strategy that never trades, for registry tests.
class IdleStrategy : public ordersim::IStrategy {
 public:
  std::string name() const override { return "idle"; }
  StrategyDecision onBar(const StrategyContext&) override { return {}; }
};

Candle bar(double high, double close, std::int64_t ts = 0) {
  return Candle{ts, close, high, close * 0.9, close, 100.0};
}

Order openOrder(ordersim::domain::OrderId id, Side side, OrderKind kind,
                double price) {
  Order o;
  o.id = id;
  o.symbol = "BTCUSDT";
  o.side = side;
  o.kind = kind;
  o.quantity = 1.0;
  if (kind == OrderKind::Limit) {
    o.limit_price = price;
  } else {
    o.stop_price = price;
  }
  o.state = ordersim::domain::OrderState::Working;
  return o;
}

}  // namespace

// =============================================================================
// Fixture: state a StrategyContext points into.
// =============================================================================
class StrategyTest : public ::testing::Test {
 protected:
  std::string symbol{"BTCUSDT"};
  std::deque<Candle> candles;
  Position position;
  std::vector<Order> open_orders;

  ordersim::TimeframeWindows timeframes;

  StrategyContext context() const {
    return StrategyContext{symbol,   candles,  position, open_orders,
                           100000.0, 100000.0, 0,
                           timeframes.empty() ? nullptr : &timeframes};
  }
};

// -----------------------------------------------------------------------------
// 1. Built-ins are registered under stable names.
// -----------------------------------------------------------------------------
TEST(StrategyRegistryTest, BuiltinsRegistered) {
  const StrategyRegistry registry = StrategyRegistry::withBuiltins();

  EXPECT_EQ(registry.names(), (std::vector<std::string>{"breakout", "grid"}));
  EXPECT_TRUE(registry.contains("grid"));
  EXPECT_FALSE(registry.contains("martingale"));
  ASSERT_NE(registry.entry("grid"), nullptr);
  EXPECT_EQ(registry.entry("grid")->kind, ordersim::StrategyKind::Grid);
  EXPECT_EQ(registry.entry("nope"), nullptr);
}

// -----------------------------------------------------------------------------
// 2. create() applies params; missing params fall back to defaults.
// -----------------------------------------------------------------------------
TEST(StrategyRegistryTest, CreateAppliesParams) {
  const StrategyRegistry registry = StrategyRegistry::withBuiltins();

  auto grid = registry.create(
      "grid", nlohmann::json{{"levels", 5}, {"spacing", 0.02}});
  ASSERT_NE(grid, nullptr);
  EXPECT_EQ(grid->name(), "grid");
  const auto* typed = dynamic_cast<GridStrategy*>(grid.get());
  ASSERT_NE(typed, nullptr);
  EXPECT_EQ(typed->params().levels, 5u);
  EXPECT_DOUBLE_EQ(typed->params().spacing, 0.02);
  EXPECT_DOUBLE_EQ(typed->params().quantity, 1.0);

  auto breakout = registry.create("breakout", nullptr);
  ASSERT_NE(breakout, nullptr);
  EXPECT_EQ(breakout->name(), "breakout");

  auto filtered =
      registry.create("breakout", nlohmann::json{{"trend_timeframe", "1h"}});
  const auto* typed_breakout = dynamic_cast<BreakoutStrategy*>(filtered.get());
  ASSERT_NE(typed_breakout, nullptr);
  EXPECT_EQ(typed_breakout->params().trend_timeframe, "1h");
}

// -----------------------------------------------------------------------------
// 3. Unknown names and bad params are ConfigErrors, not crashes.
// Why: These come straight from a user's config file.
// -----------------------------------------------------------------------------
TEST(StrategyRegistryTest, CreateRejectsBadInput) {
  const StrategyRegistry registry = StrategyRegistry::withBuiltins();

  EXPECT_THROW(registry.create("martingale", {}), ConfigError);
  EXPECT_THROW(registry.create("grid", nlohmann::json::array()), ConfigError);
  EXPECT_THROW(registry.create("grid", nlohmann::json{{"levels", 0}}),
               ConfigError);
  EXPECT_THROW(registry.create("grid", nlohmann::json{{"spacing", "wide"}}),
               ConfigError);
  EXPECT_THROW(registry.create("breakout", nlohmann::json{{"stop_loss", 1.5}}),
               ConfigError);
  EXPECT_THROW(
      registry.create("breakout", nlohmann::json{{"trend_timeframe", 60}}),
      ConfigError);
}

TEST(StrategyRegistryTest, CustomEntry) {
  StrategyRegistry registry;
  registry.add("idle", StrategyRegistry::Entry{
                           ordersim::StrategyKind::Grid, "does nothing",
                           [](const nlohmann::json&) {
                             return std::make_unique<IdleStrategy>();
                           }});

  ASSERT_TRUE(registry.contains("idle"));
  EXPECT_EQ(registry.create("idle", {})->name(), "idle");
}

// -----------------------------------------------------------------------------
// 4. Grid lays a ladder of buy limits below the close when it has none.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, GridLaysBuyLadder) {
  GridStrategy grid(GridParams{3, 0.01, 2.0});
  candles.push_back(bar(101.0, 100.0));

  StrategyDecision decision = grid.onBar(context());

  ASSERT_EQ(decision.orders.size(), 3u);
  EXPECT_TRUE(decision.cancels.empty());
  for (std::size_t k = 0; k < 3; ++k) {
    const auto& r = decision.orders[k];
    EXPECT_EQ(r.kind, OrderKind::Limit);
    EXPECT_EQ(r.side, Side::Buy);
    EXPECT_DOUBLE_EQ(r.quantity, 2.0);
    ASSERT_TRUE(r.limit_price.has_value());
    EXPECT_DOUBLE_EQ(*r.limit_price,
                     100.0 * (1.0 - static_cast<double>(k + 1) * 0.01));
    EXPECT_EQ(r.strategy_id, "grid");
  }

  // With buys already resting, nothing new is laid.
  open_orders.push_back(openOrder(1, Side::Buy, OrderKind::Limit, 99.0));
  EXPECT_TRUE(grid.onBar(context()).empty());
}

// -----------------------------------------------------------------------------
// 5. Grid places one take-profit for the whole long position.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, GridTakesProfitWhenLong) {
  GridStrategy grid(GridParams{2, 0.01, 1.0});
  candles.push_back(bar(101.0, 100.0));
  position.symbol = symbol;
  position.quantity = 2.0;
  position.average_entry_price = 98.0;
  open_orders.push_back(openOrder(1, Side::Buy, OrderKind::Limit, 97.0));

  StrategyDecision decision = grid.onBar(context());

  ASSERT_EQ(decision.orders.size(), 1u);
  const auto& tp = decision.orders[0];
  EXPECT_EQ(tp.side, Side::Sell);
  EXPECT_DOUBLE_EQ(tp.quantity, 2.0);
  EXPECT_DOUBLE_EQ(*tp.limit_price, 98.0 * 1.01);

  open_orders.push_back(openOrder(2, Side::Sell, OrderKind::Limit, 98.98));
  EXPECT_TRUE(grid.onBar(context()).empty());
}

// -----------------------------------------------------------------------------
// 6. Breakout waits for a full window, then places a stop at its high.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, BreakoutPlacesEntryAtWindowHigh) {
  BreakoutStrategy breakout(BreakoutParams{3, 1.0, 0.02});

  candles.push_back(bar(104.0, 100.0));
  candles.push_back(bar(102.0, 100.0));
  EXPECT_TRUE(breakout.onBar(context()).empty());

  candles.push_back(bar(103.0, 101.0));
  StrategyDecision decision = breakout.onBar(context());

  ASSERT_EQ(decision.orders.size(), 1u);
  EXPECT_EQ(decision.orders[0].kind, OrderKind::Stop);
  EXPECT_EQ(decision.orders[0].side, Side::Buy);
  EXPECT_DOUBLE_EQ(*decision.orders[0].stop_price, 104.0);
  EXPECT_EQ(decision.orders[0].strategy_id, "breakout");
}

// -----------------------------------------------------------------------------
// 7. When the window high moves, the stale entry stop is replaced.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, BreakoutRepricesEntry) {
  BreakoutStrategy breakout(BreakoutParams{2, 1.0, 0.02});
  candles.push_back(bar(104.0, 100.0));
  candles.push_back(bar(102.0, 100.0));
  candles.push_back(bar(101.0, 100.0));  // window: 102, 101
  open_orders.push_back(openOrder(5, Side::Buy, OrderKind::Stop, 104.0));

  StrategyDecision decision = breakout.onBar(context());

  EXPECT_EQ(decision.cancels, (std::vector<ordersim::domain::OrderId>{5}));
  ASSERT_EQ(decision.orders.size(), 1u);
  EXPECT_DOUBLE_EQ(*decision.orders[0].stop_price, 102.0);

  // Entry already at the window high: nothing to do.
  open_orders.clear();
  open_orders.push_back(openOrder(6, Side::Buy, OrderKind::Stop, 102.0));
  EXPECT_TRUE(breakout.onBar(context()).empty());
}

// -----------------------------------------------------------------------------
// 8. Once long, the entry is cancelled and a protective stop placed.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, BreakoutProtectsLongPosition) {
  BreakoutStrategy breakout(BreakoutParams{1, 1.0, 0.05});
  candles.push_back(bar(110.0, 108.0));
  position.symbol = symbol;
  position.quantity = 1.0;
  position.average_entry_price = 104.0;
  open_orders.push_back(openOrder(9, Side::Buy, OrderKind::Stop, 110.0));

  StrategyDecision decision = breakout.onBar(context());

  EXPECT_EQ(decision.cancels, (std::vector<ordersim::domain::OrderId>{9}));
  ASSERT_EQ(decision.orders.size(), 1u);
  EXPECT_EQ(decision.orders[0].side, Side::Sell);
  EXPECT_DOUBLE_EQ(decision.orders[0].quantity, 1.0);
  EXPECT_DOUBLE_EQ(*decision.orders[0].stop_price, 104.0 * 0.95);
}

// -----------------------------------------------------------------------------
// 9. With a trend timeframe, the entry is armed only while the last bar of
//    that timeframe closed up, and withdrawn when it turns down.
// -----------------------------------------------------------------------------
TEST_F(StrategyTest, BreakoutFollowsHigherTimeframeTrend) {
  BreakoutParams params{2, 1.0, 0.02, "1h"};
  BreakoutStrategy breakout(params);
  candles.push_back(bar(104.0, 100.0));
  candles.push_back(bar(103.0, 101.0));

  // Timeframe not fed yet: no entry.
  EXPECT_TRUE(breakout.onBar(context()).empty());

  // Up bar on the hour: entry at the window high.
  timeframes["1h"].push_back(Candle{0, 95.0, 105.0, 94.0, 102.0, 1000.0});
  StrategyDecision armed = breakout.onBar(context());
  ASSERT_EQ(armed.orders.size(), 1u);
  EXPECT_DOUBLE_EQ(*armed.orders[0].stop_price, 104.0);

  // Down bar on the hour: the resting entry is cancelled, none replaces it.
  timeframes["1h"].push_back(
      Candle{3'600'000, 102.0, 103.0, 96.0, 97.0, 1000.0});
  open_orders.push_back(openOrder(4, Side::Buy, OrderKind::Stop, 104.0));
  StrategyDecision withdrawn = breakout.onBar(context());
  EXPECT_EQ(withdrawn.cancels, (std::vector<ordersim::domain::OrderId>{4}));
  EXPECT_TRUE(withdrawn.orders.empty());
}
