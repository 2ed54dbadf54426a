#pragma once

#include "ordersim/domain/order_request.hpp"
#include "ordersim/domain/reject_reason.hpp"
#include "ordersim/events/event_types.hpp"

namespace ordersim {

// A request that never reached the book, with the reason it was refused.
struct OrderRejectedEvent {
  domain::OrderRequest request;
  domain::RejectReason reason{domain::RejectReason::NonPositiveQuantity};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
