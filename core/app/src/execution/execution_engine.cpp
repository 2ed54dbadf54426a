#include "ordersim/execution/execution_engine.hpp"
#include "ordersim/time/time_utils.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace ordersim {

using domain::Candle;
using domain::Order;
using domain::OrderId;
using domain::OrderKind;
using domain::OrderState;
using domain::Side;
using domain::TimeInForce;

namespace {

// -----------------------------------------------------------------------------
// LiquidityBudget — per-bar matched quantity per (side, lane, level price)
// -----------------------------------------------------------------------------
class LiquidityBudget {
 public:
  LiquidityBudget(std::optional<double> fraction, double volume) {
    if (fraction.has_value()) {
      cap_ = *fraction * volume;
    }
  }

  double available(Side side, OrderBook::Lane lane, double price) const {
    if (!cap_.has_value()) {
      return std::numeric_limits<double>::infinity();
    }
    auto it = used_.find(key(side, lane, price));
    const double used = it == used_.end() ? 0.0 : it->second;
    return std::max(0.0, *cap_ - used);
  }

  void consume(Side side, OrderBook::Lane lane, double price,
               double quantity) {
    if (cap_.has_value()) {
      used_[key(side, lane, price)] += quantity;
    }
  }

 private:
  using Key = std::tuple<int, int, double>;

  static Key key(Side side, OrderBook::Lane lane, double price) {
    return Key{static_cast<int>(side), static_cast<int>(lane), price};
  }

  std::optional<double> cap_;
  std::map<Key, double> used_;
};

bool isExpired(const Order& order, std::int64_t bar_time_ms) {
  switch (order.time_in_force) {
    case TimeInForce::Day:
      return order.session_day.has_value() &&
             utc_day(bar_time_ms) > *order.session_day;
    case TimeInForce::GTD:
      return bar_time_ms > order.expire_at_ms;
    case TimeInForce::GTC:
    case TimeInForce::IOC:
    case TimeInForce::FOK:
      return false;
  }
  return false;
}

bool isImmediate(const Order& order) {
  return order.time_in_force == TimeInForce::IOC ||
         order.time_in_force == TimeInForce::FOK;
}

}  // namespace

// -----------------------------------------------------------------------------
// BarContext — state of one fill pass
// -----------------------------------------------------------------------------
struct ExecutionEngine::BarContext {
  const Candle& candle;
  OrderBook& book;
  LiquidityBudget budget;
  BarReport& report;
};

ExecutionEngine::ExecutionEngine(ExecutionConfig config)
    : config_(std::move(config)) {
  if (!(config_.slippage >= 0.0 && config_.slippage < 1.0)) {
    throw std::invalid_argument(
        "ExecutionEngine: slippage must be in [0, 1), got " +
        std::to_string(config_.slippage));
  }
}

double ExecutionEngine::marketFillPrice(Side side, double open) const {
  return side == Side::Buy ? open * (1.0 + config_.slippage)
                           : open * (1.0 - config_.slippage);
}

double ExecutionEngine::commission(double price, double quantity,
                                   bool is_maker) const {
  const double rate = is_maker ? config_.maker_commission_rate
                               : config_.taker_commission_rate;
  return price * quantity * rate;
}

// -----------------------------------------------------------------------------
// processBar(): fixed pass order, see header
// -----------------------------------------------------------------------------
BarReport ExecutionEngine::processBar(const Candle& candle,
                                      OrderBook& book) const {
  BarReport report;

  if (auto error = domain::validateCandle(candle)) {
    report.data_error = error;
    return report;
  }

  BarContext ctx{candle, book,
                 LiquidityBudget(config_.volume_cap_fraction, candle.volume),
                 report};

  expireOrders(ctx);
  fillMarketOrders(ctx);
  sweepLimits(ctx, Side::Buy);
  sweepStops(ctx, Side::Buy);
  sweepLimits(ctx, Side::Sell);
  sweepStops(ctx, Side::Sell);
  cancelImmediateOrders(ctx);

  return report;
}

// -----------------------------------------------------------------------------
// Step 2: Day / GTD expiry at the bar boundary
// -----------------------------------------------------------------------------
void ExecutionEngine::expireOrders(BarContext& ctx) const {
  const std::int64_t ts = ctx.candle.datetime_ms;
  for (const Order& order : ctx.book.openOrders()) {
    if (order.time_in_force == TimeInForce::Day &&
        !order.session_day.has_value()) {
      ctx.book.anchorSessionDay(order.id, utc_day(ts), ts);
      continue;
    }
    if (!isExpired(order, ts)) {
      continue;
    }
    Order expired = ctx.book.retire(order.id, OrderState::Expired, ts);
    ctx.report.transitions.push_back(OrderTransition{expired, order.state});
  }
}

// -----------------------------------------------------------------------------
// Step 3: market orders of both sides, merged by sequence number
// -----------------------------------------------------------------------------
void ExecutionEngine::fillMarketOrders(BarContext& ctx) const {
  std::vector<std::pair<std::uint64_t, OrderId>> queue;
  for (Side side : {Side::Buy, Side::Sell}) {
    for (OrderId id : ctx.book.priorityIds(side, OrderBook::Lane::Market)) {
      queue.emplace_back(ctx.book.find(id)->sequence_no, id);
    }
  }
  std::sort(queue.begin(), queue.end());

  for (const auto& [seq, id] : queue) {
    if (!ctx.book.isActive(id)) {
      continue;
    }
    const Order order = *ctx.book.find(id);
    fillUpTo(ctx, order, OrderBook::Lane::Market, 0.0,
             marketFillPrice(order.side, ctx.candle.open), false);
  }
}

// -----------------------------------------------------------------------------
// Steps 4a / 5a: limit ladders, best price first
// -----------------------------------------------------------------------------
void ExecutionEngine::sweepLimits(BarContext& ctx, Side side) const {
  const Candle& c = ctx.candle;

  for (OrderId id : ctx.book.priorityIds(side, OrderBook::Lane::Limit)) {
    if (!ctx.book.isActive(id)) {
      continue;
    }
    const Order order = *ctx.book.find(id);
    const double limit = *order.limit_price;

    double price = 0.0;
    if (side == Side::Buy) {
      if (c.low > limit) {
        continue;
      }
      price = std::min(c.open, limit);
    } else {
      if (c.high < limit) {
        continue;
      }
      price = std::max(c.open, limit);
    }

    fillUpTo(ctx, order, OrderBook::Lane::Limit, limit, price,
             price == limit);
  }
}

// -----------------------------------------------------------------------------
// Steps 4b / 5b: stop ladders, nearest trigger first
// -----------------------------------------------------------------------------
void ExecutionEngine::sweepStops(BarContext& ctx, Side side) const {
  const Candle& c = ctx.candle;
  const std::int64_t ts = c.datetime_ms;

  for (OrderId id : ctx.book.priorityIds(side, OrderBook::Lane::Stop)) {
    if (!ctx.book.isActive(id)) {
      continue;
    }
    const Order resting = *ctx.book.find(id);
    const double stop = *resting.stop_price;

    const bool fired = side == Side::Buy ? c.high >= stop : c.low <= stop;
    if (!fired) {
      continue;
    }
    const double trigger_price =
        side == Side::Buy ? std::max(c.open, stop) : std::min(c.open, stop);

    const Order promoted = ctx.book.promoteTriggered(id, ts);
    ctx.report.triggered.push_back(id);

    if (promoted.kind == OrderKind::Stop) {
      fillUpTo(ctx, promoted, OrderBook::Lane::Stop, stop, trigger_price,
               false);
      continue;
    }

    // StopLimit: a limit for the rest of the bar, with T in place of the open.
    const double limit = *promoted.limit_price;
    const bool touched = side == Side::Buy ? c.low <= limit : c.high >= limit;
    if (!touched) {
      continue;
    }
    const double price = side == Side::Buy ? std::min(trigger_price, limit)
                                           : std::max(trigger_price, limit);
    fillUpTo(ctx, promoted, OrderBook::Lane::Limit, limit, price,
             price == limit);
  }
}

// -----------------------------------------------------------------------------
// Step 6: IOC / FOK never outlive their first pass
// -----------------------------------------------------------------------------
void ExecutionEngine::cancelImmediateOrders(BarContext& ctx) const {
  const std::int64_t ts = ctx.candle.datetime_ms;
  for (const Order& order : ctx.book.openOrders()) {
    if (!isImmediate(order)) {
      continue;
    }
    Order cancelled = ctx.book.retire(order.id, OrderState::Cancelled, ts);
    ctx.report.transitions.push_back(OrderTransition{cancelled, order.state});
  }
}

// -----------------------------------------------------------------------------
// fillUpTo(): one fill limited by the remaining quantity and the budget
// -----------------------------------------------------------------------------
double ExecutionEngine::fillUpTo(BarContext& ctx, const Order& order,
                                 OrderBook::Lane lane, double level_price,
                                 double fill_price, bool is_maker) const {
  const double remaining = order.remaining();
  const double available = ctx.budget.available(order.side, lane, level_price);
  const double quantity = std::min(remaining, available);

  if (order.time_in_force == TimeInForce::FOK &&
      quantity + domain::kQuantityEpsilon < remaining) {
    return 0.0;
  }
  if (quantity <= domain::kQuantityEpsilon) {
    return 0.0;
  }

  const std::int64_t ts = ctx.candle.datetime_ms;
  Order updated = ctx.book.applyFill(order.id, quantity, fill_price, ts);
  ctx.budget.consume(order.side, lane, level_price, quantity);

  domain::Fill fill;
  fill.order_id = order.id;
  fill.symbol = order.symbol;
  fill.side = order.side;
  fill.price = fill_price;
  fill.quantity = quantity;
  fill.commission = commission(fill_price, quantity, is_maker);
  fill.timestamp_ms = ts;
  fill.is_maker = is_maker;

  ctx.report.fills.push_back(fill);
  ctx.report.transitions.push_back(
      OrderTransition{std::move(updated), order.state});
  return quantity;
}

}  // namespace ordersim
