#pragma once

namespace ordersim {
namespace domain {

// -----------------------------------------------------------------------------
// OrderState — simulated order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy between submission to the OrderBook
//         and its removal into the terminal archive.
//
// @details
// Legal transitions (checked by canTransition()):
//
//   New ──> Working ──> PartiallyFilled ──> Filled
//    │         │  │           │  │
//    │         │  └──> Filled │  └──> Cancelled / Expired
//    │         └──> Cancelled / Expired
//    └──> Rejected
//
// Working and PartiallyFilled differ only in filled_quantity > 0. A
// PartiallyFilled order may take further partial fills (PartiallyFilled ->
// PartiallyFilled) but never returns to Working.
//
// Terminal states: Filled, Cancelled, Rejected, Expired.
// -----------------------------------------------------------------------------
enum class OrderState {
  New,              // Built from a request, not yet accepted by the book
  Working,          // Resting in the book, nothing filled yet
  PartiallyFilled,  // Resting in the book with 0 < filled < quantity
  Filled,           // Fully filled — terminal
  Cancelled,        // Cancelled by request or IOC/FOK rules — terminal
  Rejected,         // Failed validation or pre-trade risk — terminal
  Expired,          // Day/GTD validity elapsed at a bar boundary — terminal
};

// -------------------------------------------------------------------------
// isTerminal(state)
// -------------------------------------------------------------------------
// @brief  True for Filled, Cancelled, Rejected and Expired.
// -------------------------------------------------------------------------
bool isTerminal(OrderState state);

// -------------------------------------------------------------------------
// canTransition(current, next)
// -------------------------------------------------------------------------
// @brief  Validates a single state-machine edge.
//
// @param  current  State the order is in now.
// @param  next     Proposed state.
// @return true if the edge exists in the graph above.
//
// @details
// Pure function. The OrderBook consults it before every mutation and treats
// a false result as an invariant violation.
// -------------------------------------------------------------------------
bool canTransition(OrderState current, OrderState next);

// Stable upper-case name used in logs and checkpoints.
const char* toString(OrderState state);

}  // namespace domain
}  // namespace ordersim
