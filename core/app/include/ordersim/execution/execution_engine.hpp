#pragma once

#include "ordersim/book/order_book.hpp"
#include "ordersim/domain/candle.hpp"
#include "ordersim/domain/fill.hpp"
#include "ordersim/domain/order.hpp"
#include "ordersim/execution/execution_config.hpp"

#include <optional>
#include <vector>

namespace ordersim {

// One order state change produced during a fill pass.
struct OrderTransition {
  domain::Order order;   // Snapshot after the change
  domain::OrderState previous_state{domain::OrderState::Working};
};

// -----------------------------------------------------------------------------
// BarReport — everything one fill pass did to one book
// -----------------------------------------------------------------------------
// fills         in emission order (the deterministic pass order below)
// transitions   fills, expiries and IOC/FOK cancels, in the order they happened
// triggered     stops whose trigger fired this bar
// data_error    set when the candle was rejected; then nothing else is set
// -----------------------------------------------------------------------------
struct BarReport {
  std::vector<domain::Fill> fills;
  std::vector<OrderTransition> transitions;
  std::vector<domain::OrderId> triggered;
  std::optional<domain::CandleError> data_error;

  bool ok() const { return !data_error.has_value(); }
};

// -----------------------------------------------------------------------------
// ExecutionEngine — OHLCV fill model
// -----------------------------------------------------------------------------
//
// @brief  Given one candle and the book of its symbol, decides which resting
//         orders fill, at what price and for how much, and applies the
//         result to the book.
//
// @details
// A bar carries four prices and a volume, not a path. The engine therefore
// fixes one intra-bar path and always uses it:
//
//   1. Reject a malformed candle. The book is not touched.
//   2. Expire Day orders whose session day is earlier than the bar's UTC
//      day and GTD orders whose expire_at_ms is before the bar. A Day order
//      without a session day is anchored to this bar's day instead.
//   3. Market orders (including stops triggered on an earlier bar), across
//      both sides in sequence order, at open * (1 +/- slippage). Taker.
//   4. Buy side, low leg then high leg:
//        limit buys from the highest price down:
//          fill iff low <= L, at min(open, L)
//        buy stops from the lowest trigger up:
//          trigger iff high >= S, trigger price T = max(open, S)
//   5. Sell side, high leg then low leg:
//        limit sells from the lowest price up:
//          fill iff high >= L, at max(open, L)
//        sell stops from the highest trigger down:
//          trigger iff low <= S, trigger price T = min(open, S)
//   6. Cancel what is left of IOC and FOK orders.
//
// A triggered Stop fills at T with no slippage. A triggered StopLimit becomes
// a limit order for the rest of the same bar, with T standing in for the
// open: a buy fills iff low <= L at min(T, L), a sell iff high >= L at
// max(T, L). Otherwise it rests as a limit for later bars.
//
// Commission is price * quantity * rate. A limit filled at exactly its own
// price pays the maker rate; market, stop, stop-limit trigger and
// gap-through limit fills pay the taker rate.
//
// Liquidity cap: with volume_cap_fraction set, each (side, lane, level
// price) may match at most fraction * volume per bar. Orders at a level are
// visited in sequence order, so the earliest gets filled first and the one
// that exhausts the budget gets a partial fill. FOK orders fill only if the
// whole remainder fits.
//
// Thread model:
//   Stateless apart from the immutable config; processBar() is const.
//   Separate runs use separate books and may share nothing else.
// -----------------------------------------------------------------------------
class ExecutionEngine {
 public:
  // @throws std::invalid_argument unless 0 <= slippage < 1.
  explicit ExecutionEngine(ExecutionConfig config = {});

  // -------------------------------------------------------------------------
  // processBar(candle, book)
  // -------------------------------------------------------------------------
  // @brief  Runs one fill pass over `book` for `candle`.
  //
  // @return BarReport; fills are already applied to the book.
  //
  // @throws InvariantViolation (from the book) if a fill would break an
  //         order invariant. Never happens with a consistent book.
  // -------------------------------------------------------------------------
  BarReport processBar(const domain::Candle& candle, OrderBook& book) const;

  const ExecutionConfig& config() const { return config_; }

  // Reference price for a market order on `side` at `open`.
  double marketFillPrice(domain::Side side, double open) const;

  double commission(double price, double quantity, bool is_maker) const;

 private:
  struct BarContext;

  void expireOrders(BarContext& ctx) const;
  void fillMarketOrders(BarContext& ctx) const;
  void sweepLimits(BarContext& ctx, domain::Side side) const;
  void sweepStops(BarContext& ctx, domain::Side side) const;
  void cancelImmediateOrders(BarContext& ctx) const;

  double fillUpTo(BarContext& ctx, const domain::Order& order,
                  OrderBook::Lane lane, double level_price, double fill_price,
                  bool is_maker) const;

  ExecutionConfig config_;
};

}  // namespace ordersim
