#include "ordersim/domain/order.hpp"

#include <cmath>

namespace ordersim {
namespace domain {

namespace {

bool usesLimitPrice(OrderKind kind) {
  return kind == OrderKind::Limit || kind == OrderKind::StopLimit;
}

bool usesStopPrice(OrderKind kind) {
  return kind == OrderKind::Stop || kind == OrderKind::StopLimit;
}

bool isPositivePrice(double price) {
  return std::isfinite(price) && price > 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateOrder: first failing check wins
// -----------------------------------------------------------------------------
std::optional<RejectReason> validateOrder(const Order& order) {
  if (!std::isfinite(order.quantity)) {
    return RejectReason::NonFiniteQuantity;
  }
  if (order.quantity <= 0.0) {
    return RejectReason::NonPositiveQuantity;
  }

  if (usesLimitPrice(order.kind)) {
    if (!order.limit_price.has_value()) {
      return RejectReason::MissingLimitPrice;
    }
    if (!isPositivePrice(*order.limit_price)) {
      return RejectReason::NonPositiveLimitPrice;
    }
  }

  if (usesStopPrice(order.kind)) {
    if (!order.stop_price.has_value()) {
      return RejectReason::MissingStopPrice;
    }
    if (!isPositivePrice(*order.stop_price)) {
      return RejectReason::NonPositiveStopPrice;
    }
  }

  if (order.time_in_force == TimeInForce::GTD && order.expire_at_ms <= 0) {
    return RejectReason::MissingExpiry;
  }

  return std::nullopt;
}

const char* toString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market:    return "MARKET";
    case OrderKind::Limit:     return "LIMIT";
    case OrderKind::Stop:      return "STOP";
    case OrderKind::StopLimit: return "STOP_LIMIT";
  }
  return "UNKNOWN";
}

const char* toString(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::GTC: return "GTC";
    case TimeInForce::Day: return "DAY";
    case TimeInForce::GTD: return "GTD";
    case TimeInForce::IOC: return "IOC";
    case TimeInForce::FOK: return "FOK";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace ordersim
