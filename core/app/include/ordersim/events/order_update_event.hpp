#pragma once

#include "ordersim/domain/order.hpp"
#include "ordersim/domain/order_state.hpp"
#include "ordersim/events/event_types.hpp"

namespace ordersim {

// One state transition of one order: accepted, filled, cancelled, expired.
struct OrderUpdateEvent {
  domain::Order order;                                      // After transition
  domain::OrderState previous_state{domain::OrderState::New};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
