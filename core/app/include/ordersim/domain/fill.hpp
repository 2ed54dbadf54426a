#pragma once

#include "ordersim/domain/order.hpp"

#include <cstdint>
#include <string>

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// Fill — one execution against one order
// -----------------------------------------------------------------------------
//
// @brief  Transient value event produced by the ExecutionEngine and folded
//         into positions by the PositionManager.
//
// @details
// price > 0 and 0 < quantity <= remaining quantity of the order at the time
// the fill was produced. commission is already in quote currency
// (price * quantity * rate). is_maker is true when a resting limit filled at
// its own limit price; market, stop and gap-through fills are takers.
// -----------------------------------------------------------------------------
struct Fill {
  OrderId order_id{};
  std::string symbol;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double commission{0.0};
  std::int64_t timestamp_ms{0};
  bool is_maker{false};

  // Positive for buys, negative for sells.
  double signedQuantity() const { return sideSign(side) * quantity; }
  double notional() const { return price * quantity; }
};

}  // namespace domain
}  // namespace ordersim
