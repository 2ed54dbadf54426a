#pragma once

#include "ordersim/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// OrderRequest — what a strategy (or any driver) asks the engine to do
// -----------------------------------------------------------------------------
//
// @brief  The intent half of an Order. Carries no id, sequence number or
//         state; those are assigned when the request is accepted.
//
// @details
// The static helpers cover the common shapes so call sites read as
// `OrderRequest::limit("BTCUSDT", Side::Buy, 1.0, 97.0)`. Fields stay public
// so callers can adjust time_in_force, client_id etc. afterwards.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  OrderKind kind{OrderKind::Market};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TimeInForce time_in_force{TimeInForce::GTC};
  std::int64_t expire_at_ms{0};
  std::string client_id;
  std::string strategy_id;

  static OrderRequest market(std::string symbol, Side side, double quantity) {
    OrderRequest r;
    r.symbol = std::move(symbol);
    r.side = side;
    r.kind = OrderKind::Market;
    r.quantity = quantity;
    return r;
  }

  static OrderRequest limit(std::string symbol, Side side, double quantity,
                            double limit_price) {
    OrderRequest r = market(std::move(symbol), side, quantity);
    r.kind = OrderKind::Limit;
    r.limit_price = limit_price;
    return r;
  }

  static OrderRequest stop(std::string symbol, Side side, double quantity,
                           double stop_price) {
    OrderRequest r = market(std::move(symbol), side, quantity);
    r.kind = OrderKind::Stop;
    r.stop_price = stop_price;
    return r;
  }

  static OrderRequest stopLimit(std::string symbol, Side side,
                                double quantity, double stop_price,
                                double limit_price) {
    OrderRequest r = market(std::move(symbol), side, quantity);
    r.kind = OrderKind::StopLimit;
    r.stop_price = stop_price;
    r.limit_price = limit_price;
    return r;
  }
};

// Builds a New order from a request; id and sequence_no stay unset.
inline Order makeOrder(const OrderRequest& request, std::int64_t now_ms) {
  Order order;
  order.client_id = request.client_id;
  order.strategy_id = request.strategy_id;
  order.symbol = request.symbol;
  order.side = request.side;
  order.kind = request.kind;
  order.quantity = request.quantity;
  order.limit_price = request.limit_price;
  order.stop_price = request.stop_price;
  order.time_in_force = request.time_in_force;
  order.expire_at_ms = request.expire_at_ms;
  order.state = OrderState::New;
  order.created_at_ms = now_ms;
  order.updated_at_ms = now_ms;
  return order;
}

}  // namespace domain
}  // namespace ordersim
