#pragma once

#include "ordersim/domain/order.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace ordersim {

// -----------------------------------------------------------------------------
// InvariantViolation — programming-level fatal condition
// -----------------------------------------------------------------------------
//
// @brief  Thrown when the simulation reaches a state that correct inputs can
//         never produce (a fill larger than the remaining quantity, an
//         illegal state transition, a fill against an unknown order).
//
// @details
// Nothing inside the engine catches it. The run fails with the failing order
// id, the bar being processed and a textual dump of the book, all folded
// into what() so a plain `catch (const std::exception&)` in main() prints
// everything needed to debug it.
// -----------------------------------------------------------------------------
class InvariantViolation : public std::logic_error {
 public:
  InvariantViolation(const std::string& message, domain::OrderId order_id,
                     std::int64_t bar_time_ms, std::string book_snapshot)
      : std::logic_error(compose(message, order_id, bar_time_ms,
                                 book_snapshot)),
        order_id_(order_id),
        bar_time_ms_(bar_time_ms),
        book_snapshot_(std::move(book_snapshot)) {}

  domain::OrderId orderId() const noexcept { return order_id_; }
  std::int64_t barTimeMs() const noexcept { return bar_time_ms_; }
  const std::string& bookSnapshot() const noexcept { return book_snapshot_; }

 private:
  static std::string compose(const std::string& message,
                             domain::OrderId order_id,
                             std::int64_t bar_time_ms,
                             const std::string& book_snapshot) {
    return "invariant violation: " + message +
           " (order_id=" + std::to_string(order_id) +
           ", bar_time_ms=" + std::to_string(bar_time_ms) + ")\n" +
           book_snapshot;
  }

  domain::OrderId order_id_;
  std::int64_t bar_time_ms_;
  std::string book_snapshot_;
};

}  // namespace ordersim
