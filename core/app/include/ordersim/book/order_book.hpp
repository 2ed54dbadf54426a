#pragma once

#include "ordersim/concurrent/order_id_generator.hpp"
#include "ordersim/domain/order.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// SubmitResult — outcome of OrderBook::insert / Backtester::submit
// -----------------------------------------------------------------------------
// Accepted: id is set and order is the Working snapshot.
// Rejected: id is empty, reject_reason is set and order is the Rejected
//           snapshot (id 0, sequence_no 0). Nothing in the book changed.
// -----------------------------------------------------------------------------
struct SubmitResult {
  std::optional<domain::OrderId> id;
  std::optional<domain::RejectReason> reject_reason;
  domain::Order order;

  bool accepted() const { return id.has_value(); }

  static SubmitResult accept(const domain::Order& order) {
    return SubmitResult{order.id, std::nullopt, order};
  }

  static SubmitResult reject(domain::Order order, domain::RejectReason reason) {
    order.state = domain::OrderState::Rejected;
    order.reject_reason = reason;
    return SubmitResult{std::nullopt, reason, std::move(order)};
  }
};

enum class CancelResult {
  Ok,               // Order was Working/PartiallyFilled and is now Cancelled
  AlreadyTerminal,  // Filled, Cancelled or Expired before this request
  UnknownOrder,     // Never accepted by this book
};

const char* toString(CancelResult result);

// -----------------------------------------------------------------------------
// OrderBook — resting orders of one symbol, indexed for price-time priority
// -----------------------------------------------------------------------------
//
// @brief  Owns every active order of a symbol and keeps them ordered the way
//         the ExecutionEngine must visit them. Knows nothing about candles.
//
// @details
// Storage is an arena plus index:
//
//   arena_        dense vector of slots, one Order each; freed slots are
//                 recycled through free_slots_
//   lanes         per side: a FIFO of market orders, a ladder of limit
//                 levels and a ladder of stop levels; every level is a list
//                 of slot indices kept in ascending sequence_no
//   index_        order id -> {slot, lane, price, list iterator}, so cancel
//                 unlinks in O(1) without scanning a level
//   archive_      terminal orders, keyed by id, for find() and reporting
//
// Ladder ordering (begin() is visited first):
//
//   bid limits   descending price   (highest bid first)
//   ask limits   ascending price    (lowest ask first)
//   buy stops    ascending price    (nearest trigger above the market first)
//   sell stops   descending price   (nearest trigger below the market first)
//
// Triggered stops move lanes and keep their sequence_no: a Stop joins the
// market FIFO, a StopLimit joins the limit ladder at its limit price.
//
// sequence_no comes from a counter owned by this book. Order ids come from
// the OrderIdGenerator of the owning Backtester so they are unique across
// all symbols of a run and independent of every other run.
//
// Complexity: insert and ladder lookups O(log levels); cancel O(1) unlink
// plus O(log levels) to drop an emptied level; best() O(1).
//
// Thread model:
//   Single-threaded. One Backtester drives its books from one thread.
//
// Ownership:
//   Owned by Backtester (one per symbol). Holds a reference to the run's
//   OrderIdGenerator, which must outlive it.
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  enum class Lane {
    Market,  // Market orders and triggered Stop orders
    Limit,   // Limit orders and triggered StopLimit orders
    Stop,    // Untriggered Stop and StopLimit orders
  };

  OrderBook(std::string symbol, OrderIdGenerator& ids);

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;
  OrderBook(OrderBook&&) = delete;
  OrderBook& operator=(OrderBook&&) = delete;

  // -------------------------------------------------------------------------
  // insert(order)
  // -------------------------------------------------------------------------
  // @brief  Validates a New order and, if valid, assigns its id and
  //         sequence number and rests it as Working.
  //
  // @param  order  A New order, usually from makeOrder(). Its id,
  //                sequence_no and fill fields are overwritten.
  //
  // @return SubmitResult. Rejections (validateOrder() failures and symbol
  //         mismatches) consume neither an id nor a sequence number and
  //         leave the book untouched, so repeating them is harmless.
  // -------------------------------------------------------------------------
  SubmitResult insert(domain::Order order);

  // -------------------------------------------------------------------------
  // cancel(id, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Removes a Working/PartiallyFilled order and archives it as
  //         Cancelled. Never throws for unknown or finished orders.
  // -------------------------------------------------------------------------
  CancelResult cancel(domain::OrderId id, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // hydrate(order)
  // -------------------------------------------------------------------------
  // @brief  Restores an open order from a checkpoint, keeping its id and
  //         sequence_no.
  //
  // @details
  // Throws std::invalid_argument for an order of another symbol, a terminal
  // order, an order that fails validateOrder() or a duplicate id. Advances
  // the book's sequence counter and the id generator past the restored
  // values.
  // -------------------------------------------------------------------------
  void hydrate(domain::Order order);

  // --- Read-only views ------------------------------------------------------

  // Best resting limit price on a side (highest bid / lowest ask).
  std::optional<double> best(domain::Side side) const;

  // Limit orders resting at exactly `price` on `side`, in sequence order.
  std::vector<const domain::Order*> ordersAt(domain::Side side,
                                             double price) const;

  // All limit orders of a side in matching priority: price, then sequence.
  std::vector<const domain::Order*> iterPriority(domain::Side side) const;

  // Ids of one lane of one side in the order the fill pass visits them.
  std::vector<domain::OrderId> priorityIds(domain::Side side, Lane lane) const;

  // Snapshots of every active order, ascending sequence_no.
  std::vector<domain::Order> openOrders() const;

  // Active or archived order, nullptr if this book never accepted the id.
  // The pointer is invalidated by the next mutation of the book.
  const domain::Order* find(domain::OrderId id) const;

  bool isActive(domain::OrderId id) const;
  std::size_t activeCount() const { return index_.size(); }

  // Terminal orders, ascending id.
  std::vector<domain::Order> archived() const;

  const std::string& symbol() const { return symbol_; }

  // Human-readable dump of every lane; attached to InvariantViolation.
  std::string snapshot() const;

  // --- Mutations driven by the ExecutionEngine ------------------------------

  // -------------------------------------------------------------------------
  // applyFill(id, quantity, price, bar_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Books one fill against an active order and returns the updated
  //         snapshot. A completed order is archived as Filled.
  //
  // @throws InvariantViolation if the order is not active, the quantity or
  //         price is not positive, or quantity exceeds the remaining
  //         quantity by more than kQuantityEpsilon.
  // -------------------------------------------------------------------------
  domain::Order applyFill(domain::OrderId id, double quantity, double price,
                          std::int64_t bar_time_ms);

  // -------------------------------------------------------------------------
  // promoteTriggered(id, bar_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Marks an untriggered Stop/StopLimit as triggered and moves it to
  //         its post-trigger lane (Stop -> Market, StopLimit -> Limit).
  //
  // @throws InvariantViolation if the order is not an active, untriggered
  //         stop.
  // -------------------------------------------------------------------------
  domain::Order promoteTriggered(domain::OrderId id, std::int64_t bar_time_ms);

  // Sets session_day of an active Day order that has none yet.
  // @throws InvariantViolation if the order is not active.
  domain::Order anchorSessionDay(domain::OrderId id, std::int64_t day,
                                 std::int64_t bar_time_ms);

  // -------------------------------------------------------------------------
  // retire(id, terminal_state, bar_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves an active order to Cancelled or Expired and archives it.
  //         Used for Day/GTD expiry and IOC/FOK leftovers.
  // -------------------------------------------------------------------------
  domain::Order retire(domain::OrderId id, domain::OrderState terminal_state,
                       std::int64_t bar_time_ms);

 private:
  using SlotIndex = std::size_t;
  using Level = std::list<SlotIndex>;

  struct PriceOrder {
    bool descending{false};
    bool operator()(double a, double b) const {
      return descending ? a > b : a < b;
    }
  };
  using Ladder = std::map<double, Level, PriceOrder>;

  struct Slot {
    domain::Order order;
    bool live{false};
  };

  struct Locator {
    SlotIndex slot{0};
    Lane lane{Lane::Market};
    double price{0.0};
    Level::iterator position;
  };

  struct SideBook {
    SideBook(bool limits_descending, bool stops_descending)
        : limits(PriceOrder{limits_descending}),
          stops(PriceOrder{stops_descending}) {}

    Level market;
    Ladder limits;
    Ladder stops;
  };

  SideBook& sideBook(domain::Side side);
  const SideBook& sideBook(domain::Side side) const;

  static Lane laneFor(const domain::Order& order);
  static double levelPrice(const domain::Order& order, Lane lane);

  SlotIndex allocate(domain::Order order);
  void link(SlotIndex slot);
  void unlink(const Locator& locator);
  Level::iterator enqueue(Level& level, SlotIndex slot);
  domain::Order archiveSlot(SlotIndex slot);

  // Looks up an active order for mutation; throws InvariantViolation.
  Locator& activeLocator(domain::OrderId id, std::int64_t bar_time_ms,
                         const char* action);
  void transition(domain::Order& order, domain::OrderState next,
                  std::int64_t bar_time_ms);

  void collectLevel(const Level& level,
                    std::vector<domain::OrderId>& out) const;

  std::string symbol_;
  OrderIdGenerator& ids_;
  std::uint64_t next_sequence_{1};

  std::vector<Slot> arena_;
  std::vector<SlotIndex> free_slots_;
  std::unordered_map<domain::OrderId, Locator> index_;
  std::unordered_map<domain::OrderId, domain::Order> archive_;

  SideBook bids_{true, false};   // limits descending, stops ascending
  SideBook asks_{false, true};   // limits ascending, stops descending
};

}  // namespace ordersim
