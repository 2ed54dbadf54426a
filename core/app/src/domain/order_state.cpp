#include "ordersim/domain/order_state.hpp"

namespace ordersim {
namespace domain {

bool isTerminal(OrderState state) {
  using S = OrderState;
  return state == S::Filled ||
         state == S::Cancelled ||
         state == S::Rejected ||
         state == S::Expired;
}

// -----------------------------------------------------------------------------
// canTransition: one switch arm per source state
// -----------------------------------------------------------------------------
bool canTransition(OrderState current, OrderState next) {
  using S = OrderState;

  switch (current) {
    case S::New:
      return next == S::Working ||
             next == S::Rejected;

    case S::Working:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Expired;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Expired;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Expired:
      return false;
  }

  return false;
}

const char* toString(OrderState state) {
  switch (state) {
    case OrderState::New:             return "NEW";
    case OrderState::Working:         return "WORKING";
    case OrderState::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderState::Filled:          return "FILLED";
    case OrderState::Cancelled:       return "CANCELLED";
    case OrderState::Rejected:        return "REJECTED";
    case OrderState::Expired:         return "EXPIRED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace ordersim
