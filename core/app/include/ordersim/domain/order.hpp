#pragma once

#include "ordersim/domain/order_state.hpp"
#include "ordersim/domain/reject_reason.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique within one backtest run. 0 is the "no id" sentinel carried by
// rejected orders, which never enter the book.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Market    fills at the next bar's open, adjusted by slippage.
// Limit     fills when the bar trades through limit_price.
// Stop      becomes a market order once the bar touches stop_price.
// StopLimit becomes a limit order at limit_price once stop_price is touched.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
  Stop,
  StopLimit,
};

// -----------------------------------------------------------------------------
// TimeInForce
// -----------------------------------------------------------------------------
// GTC  rests until filled or cancelled.
// Day  expires at the first bar of a later UTC calendar day than its
//      session day (see Order::session_day).
// GTD  expires at the first bar whose timestamp is past expire_at_ms.
// IOC  whatever the first fill pass does not fill is cancelled.
// FOK  fills completely in the first fill pass or is cancelled unfilled.
// -----------------------------------------------------------------------------
enum class TimeInForce {
  GTC,
  Day,
  GTD,
  IOC,
  FOK,
};

// Fill quantities below this are treated as zero. Guards the Filled
// transition against accumulated floating-point error in partial fills.
constexpr double kQuantityEpsilon = 1e-9;

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Full state of one simulated order: the request that created it plus
//         everything the book and the execution pass have done to it since.
//
// @details
// Value type. The authoritative copy lives in the OrderBook arena while the
// order is Working/PartiallyFilled and in the book's terminal archive after
// that. Every copy handed out (events, open-order views, checkpoints) is a
// snapshot.
//
// Invariants maintained by the OrderBook:
//   - 0 <= filled_quantity <= quantity
//   - sequence_no is assigned once, at insertion, and never changes
//   - state only moves along canTransition() edges
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                  // 0 until the book accepts the order
  std::string client_id;         // Caller's own tag, echoed back untouched
  std::string strategy_id;       // Strategy that produced the request
  std::string symbol;
  Side side{Side::Buy};
  OrderKind kind{OrderKind::Market};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TimeInForce time_in_force{TimeInForce::GTC};
  std::int64_t expire_at_ms{0};  // GTD only
  OrderState state{OrderState::New};
  double filled_quantity{0.0};
  double avg_fill_price{0.0};    // Quantity-weighted mean of all fills
  std::uint64_t sequence_no{0};  // Sole tie-break at equal price
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
  bool stop_triggered{false};    // Stop/StopLimit whose trigger has fired
  // Day only: UTC day the order is valid for. Unset for an order submitted
  // before the virtual clock started; the first fill pass it takes part in
  // anchors it to that bar's day.
  std::optional<std::int64_t> session_day;
  std::optional<RejectReason> reject_reason;

  double remaining() const { return quantity - filled_quantity; }
  bool isBuy() const { return side == Side::Buy; }
};

// -------------------------------------------------------------------------
// validateOrder(order)
// -------------------------------------------------------------------------
// @brief  Static checks every order must pass before it may rest in a book.
//
// @return std::nullopt when valid, otherwise the first failing reason in the
//         order: quantity, limit price, stop price, expiry.
//
// @details
// Prices are only required (and only checked) for the kinds that use them:
// Limit/StopLimit need limit_price > 0, Stop/StopLimit need stop_price > 0.
// GTD needs a positive expire_at_ms. Non-finite prices count as
// non-positive.
// -------------------------------------------------------------------------
std::optional<RejectReason> validateOrder(const Order& order);

// +1 for Buy, -1 for Sell.
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

const char* toString(Side side);
const char* toString(OrderKind kind);
const char* toString(TimeInForce tif);

}  // namespace domain
}  // namespace ordersim
