#include "ordersim/book/order_book.hpp"
#include "ordersim/domain/invariant_violation.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace ordersim {

using domain::Order;
using domain::OrderId;
using domain::OrderKind;
using domain::OrderState;
using domain::Side;

const char* toString(CancelResult result) {
  switch (result) {
    case CancelResult::Ok:              return "OK";
    case CancelResult::AlreadyTerminal: return "ALREADY_TERMINAL";
    case CancelResult::UnknownOrder:    return "UNKNOWN_ORDER";
  }
  return "UNKNOWN";
}

OrderBook::OrderBook(std::string symbol, OrderIdGenerator& ids)
    : symbol_(std::move(symbol)), ids_(ids) {}

// -----------------------------------------------------------------------------
// insert(): validate first, mutate only on acceptance
// -----------------------------------------------------------------------------
SubmitResult OrderBook::insert(Order order) {
  if (order.symbol != symbol_) {
    return SubmitResult::reject(std::move(order),
                                domain::RejectReason::SymbolMismatch);
  }
  if (auto reason = domain::validateOrder(order)) {
    return SubmitResult::reject(std::move(order), *reason);
  }

  order.id = ids_.next_id();
  order.sequence_no = next_sequence_++;
  order.filled_quantity = 0.0;
  order.avg_fill_price = 0.0;
  order.stop_triggered = false;
  order.reject_reason.reset();
  order.state = OrderState::New;
  transition(order, OrderState::Working, order.created_at_ms);

  SlotIndex slot = allocate(std::move(order));
  link(slot);
  return SubmitResult::accept(arena_[slot].order);
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
CancelResult OrderBook::cancel(OrderId id, std::int64_t now_ms) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return archive_.count(id) != 0 ? CancelResult::AlreadyTerminal
                                   : CancelResult::UnknownOrder;
  }

  SlotIndex slot = it->second.slot;
  Order& order = arena_[slot].order;
  transition(order, OrderState::Cancelled, now_ms);
  order.updated_at_ms = now_ms;
  archiveSlot(slot);
  return CancelResult::Ok;
}

// -----------------------------------------------------------------------------
// hydrate(): checkpoint restore, keeps id and sequence
// -----------------------------------------------------------------------------
void OrderBook::hydrate(Order order) {
  if (order.symbol != symbol_) {
    throw std::invalid_argument("cannot hydrate order for " + order.symbol +
                                " into book " + symbol_);
  }
  if (order.state != OrderState::Working &&
      order.state != OrderState::PartiallyFilled) {
    throw std::invalid_argument("cannot hydrate order " +
                                std::to_string(order.id) + " in state " +
                                domain::toString(order.state));
  }
  if (auto reason = domain::validateOrder(order)) {
    throw std::invalid_argument("cannot hydrate invalid order " +
                                std::to_string(order.id) + ": " +
                                domain::toString(*reason));
  }
  if (order.filled_quantity < 0.0 ||
      order.filled_quantity >= order.quantity) {
    throw std::invalid_argument("cannot hydrate order " +
                                std::to_string(order.id) +
                                " with inconsistent filled quantity");
  }

  if (order.id == 0) {
    order.id = ids_.next_id();
  } else if (index_.count(order.id) != 0 || archive_.count(order.id) != 0) {
    throw std::invalid_argument("duplicate order id " +
                                std::to_string(order.id));
  }
  ids_.advance_past(order.id);

  if (order.sequence_no == 0) {
    order.sequence_no = next_sequence_++;
  } else {
    next_sequence_ = std::max(next_sequence_, order.sequence_no + 1);
  }

  SlotIndex slot = allocate(std::move(order));
  link(slot);
}

// -----------------------------------------------------------------------------
// Read-only views
// -----------------------------------------------------------------------------
std::optional<double> OrderBook::best(Side side) const {
  const Ladder& limits = sideBook(side).limits;
  if (limits.empty()) {
    return std::nullopt;
  }
  return limits.begin()->first;
}

std::vector<const Order*> OrderBook::ordersAt(Side side, double price) const {
  std::vector<const Order*> out;
  const Ladder& limits = sideBook(side).limits;
  auto level = limits.find(price);
  if (level == limits.end()) {
    return out;
  }
  for (SlotIndex slot : level->second) {
    out.push_back(&arena_[slot].order);
  }
  return out;
}

std::vector<const Order*> OrderBook::iterPriority(Side side) const {
  std::vector<const Order*> out;
  for (const auto& [price, level] : sideBook(side).limits) {
    for (SlotIndex slot : level) {
      out.push_back(&arena_[slot].order);
    }
  }
  return out;
}

std::vector<OrderId> OrderBook::priorityIds(Side side, Lane lane) const {
  std::vector<OrderId> out;
  const SideBook& book = sideBook(side);
  switch (lane) {
    case Lane::Market:
      collectLevel(book.market, out);
      break;
    case Lane::Limit:
      for (const auto& [price, level] : book.limits) {
        collectLevel(level, out);
      }
      break;
    case Lane::Stop:
      for (const auto& [price, level] : book.stops) {
        collectLevel(level, out);
      }
      break;
  }
  return out;
}

std::vector<Order> OrderBook::openOrders() const {
  std::vector<Order> out;
  out.reserve(index_.size());
  for (const auto& [id, locator] : index_) {
    out.push_back(arena_[locator.slot].order);
  }
  std::sort(out.begin(), out.end(), [](const Order& a, const Order& b) {
    return a.sequence_no < b.sequence_no;
  });
  return out;
}

const Order* OrderBook::find(OrderId id) const {
  if (auto it = index_.find(id); it != index_.end()) {
    return &arena_[it->second.slot].order;
  }
  if (auto it = archive_.find(id); it != archive_.end()) {
    return &it->second;
  }
  return nullptr;
}

bool OrderBook::isActive(OrderId id) const {
  return index_.count(id) != 0;
}

std::vector<Order> OrderBook::archived() const {
  std::vector<Order> out;
  out.reserve(archive_.size());
  for (const auto& [id, order] : archive_) {
    out.push_back(order);
  }
  std::sort(out.begin(), out.end(),
            [](const Order& a, const Order& b) { return a.id < b.id; });
  return out;
}

// -----------------------------------------------------------------------------
// snapshot(): one line per resting order, lanes in visiting order
// -----------------------------------------------------------------------------
std::string OrderBook::snapshot() const {
  std::ostringstream out;
  out << "OrderBook[" << symbol_ << "] active=" << index_.size()
      << " archived=" << archive_.size() << "\n";

  auto dumpLevel = [this, &out](const char* label, double price,
                                const Level& level) {
    for (SlotIndex slot : level) {
      const Order& o = arena_[slot].order;
      out << "  " << label << " @" << price << " #" << o.id
          << " seq=" << o.sequence_no << " " << domain::toString(o.kind)
          << " " << domain::toString(o.state) << " filled="
          << o.filled_quantity << "/" << o.quantity << "\n";
    }
  };

  dumpLevel("BUY  MKT ", 0.0, bids_.market);
  dumpLevel("SELL MKT ", 0.0, asks_.market);
  for (const auto& [price, level] : bids_.limits) {
    dumpLevel("BUY  LMT ", price, level);
  }
  for (const auto& [price, level] : asks_.limits) {
    dumpLevel("SELL LMT ", price, level);
  }
  for (const auto& [price, level] : bids_.stops) {
    dumpLevel("BUY  STP ", price, level);
  }
  for (const auto& [price, level] : asks_.stops) {
    dumpLevel("SELL STP ", price, level);
  }
  return out.str();
}

// -----------------------------------------------------------------------------
// applyFill(): the only place filled_quantity grows
// -----------------------------------------------------------------------------
Order OrderBook::applyFill(OrderId id, double quantity, double price,
                           std::int64_t bar_time_ms) {
  Locator& locator = activeLocator(id, bar_time_ms, "fill");
  SlotIndex slot = locator.slot;
  Order& order = arena_[slot].order;

  if (!(quantity > 0.0) || !std::isfinite(price) || price <= 0.0) {
    std::ostringstream msg;
    msg << "non-positive fill qty=" << quantity << " price=" << price;
    throw InvariantViolation(msg.str(), id, bar_time_ms, snapshot());
  }

  const double remaining = order.remaining();
  if (quantity > remaining + domain::kQuantityEpsilon) {
    std::ostringstream msg;
    msg << "fill qty=" << quantity << " exceeds remaining=" << remaining;
    throw InvariantViolation(msg.str(), id, bar_time_ms, snapshot());
  }
  quantity = std::min(quantity, remaining);

  const double new_filled = order.filled_quantity + quantity;
  order.avg_fill_price =
      (order.avg_fill_price * order.filled_quantity + price * quantity) /
      new_filled;
  order.filled_quantity = new_filled;
  order.updated_at_ms = bar_time_ms;

  if (order.remaining() <= domain::kQuantityEpsilon) {
    order.filled_quantity = order.quantity;
    transition(order, OrderState::Filled, bar_time_ms);
    return archiveSlot(slot);
  }

  transition(order, OrderState::PartiallyFilled, bar_time_ms);
  return order;
}

// -----------------------------------------------------------------------------
// promoteTriggered(): relink into the post-trigger lane, sequence unchanged
// -----------------------------------------------------------------------------
Order OrderBook::promoteTriggered(OrderId id, std::int64_t bar_time_ms) {
  Locator& locator = activeLocator(id, bar_time_ms, "trigger");
  SlotIndex slot = locator.slot;
  Order& order = arena_[slot].order;

  if (locator.lane != Lane::Stop || order.stop_triggered) {
    throw InvariantViolation("trigger of an order that is not a resting stop",
                             id, bar_time_ms, snapshot());
  }

  unlink(locator);
  order.stop_triggered = true;
  order.updated_at_ms = bar_time_ms;
  link(slot);
  return order;
}

Order OrderBook::anchorSessionDay(OrderId id, std::int64_t day,
                                  std::int64_t bar_time_ms) {
  Order& order = arena_[activeLocator(id, bar_time_ms, "anchor").slot].order;
  if (!order.session_day.has_value()) {
    order.session_day = day;
  }
  return order;
}

Order OrderBook::retire(OrderId id, OrderState terminal_state,
                        std::int64_t bar_time_ms) {
  Locator& locator = activeLocator(id, bar_time_ms, "retire");
  SlotIndex slot = locator.slot;
  Order& order = arena_[slot].order;
  transition(order, terminal_state, bar_time_ms);
  order.updated_at_ms = bar_time_ms;
  return archiveSlot(slot);
}

// -----------------------------------------------------------------------------
// Arena and lane plumbing
// -----------------------------------------------------------------------------
OrderBook::SideBook& OrderBook::sideBook(Side side) {
  return side == Side::Buy ? bids_ : asks_;
}

const OrderBook::SideBook& OrderBook::sideBook(Side side) const {
  return side == Side::Buy ? bids_ : asks_;
}

OrderBook::Lane OrderBook::laneFor(const Order& order) {
  switch (order.kind) {
    case OrderKind::Market:
      return Lane::Market;
    case OrderKind::Limit:
      return Lane::Limit;
    case OrderKind::Stop:
      return order.stop_triggered ? Lane::Market : Lane::Stop;
    case OrderKind::StopLimit:
      return order.stop_triggered ? Lane::Limit : Lane::Stop;
  }
  return Lane::Market;
}

double OrderBook::levelPrice(const Order& order, Lane lane) {
  switch (lane) {
    case Lane::Market:
      return 0.0;
    case Lane::Limit:
      return order.limit_price.value_or(0.0);
    case Lane::Stop:
      return order.stop_price.value_or(0.0);
  }
  return 0.0;
}

OrderBook::SlotIndex OrderBook::allocate(Order order) {
  if (!free_slots_.empty()) {
    SlotIndex slot = free_slots_.back();
    free_slots_.pop_back();
    arena_[slot].order = std::move(order);
    arena_[slot].live = true;
    return slot;
  }
  arena_.push_back(Slot{std::move(order), true});
  return arena_.size() - 1;
}

void OrderBook::link(SlotIndex slot) {
  const Order& order = arena_[slot].order;
  const Lane lane = laneFor(order);
  const double price = levelPrice(order, lane);
  SideBook& book = sideBook(order.side);

  Level* level = nullptr;
  switch (lane) {
    case Lane::Market: level = &book.market; break;
    case Lane::Limit:  level = &book.limits[price]; break;
    case Lane::Stop:   level = &book.stops[price]; break;
  }

  Level::iterator position = enqueue(*level, slot);
  index_[order.id] = Locator{slot, lane, price, position};
}

void OrderBook::unlink(const Locator& locator) {
  SideBook& book = sideBook(arena_[locator.slot].order.side);
  if (locator.lane == Lane::Market) {
    book.market.erase(locator.position);
    return;
  }

  Ladder& ladder = locator.lane == Lane::Limit ? book.limits : book.stops;
  auto level = ladder.find(locator.price);
  level->second.erase(locator.position);
  if (level->second.empty()) {
    ladder.erase(level);
  }
}

// Appends, except when a relinked order is older than the tail of the level.
OrderBook::Level::iterator OrderBook::enqueue(Level& level, SlotIndex slot) {
  const std::uint64_t seq = arena_[slot].order.sequence_no;
  auto position = level.end();
  while (position != level.begin()) {
    auto previous = std::prev(position);
    if (arena_[*previous].order.sequence_no < seq) {
      break;
    }
    position = previous;
  }
  return level.insert(position, slot);
}

Order OrderBook::archiveSlot(SlotIndex slot) {
  const OrderId id = arena_[slot].order.id;
  auto it = index_.find(id);
  unlink(it->second);
  index_.erase(it);

  Order finished = std::move(arena_[slot].order);
  arena_[slot].order = Order{};
  arena_[slot].live = false;
  free_slots_.push_back(slot);

  archive_[id] = finished;
  return finished;
}

OrderBook::Locator& OrderBook::activeLocator(OrderId id,
                                             std::int64_t bar_time_ms,
                                             const char* action) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    throw InvariantViolation(std::string(action) + " of inactive order", id,
                             bar_time_ms, snapshot());
  }
  return it->second;
}

void OrderBook::transition(Order& order, OrderState next,
                           std::int64_t bar_time_ms) {
  if (!domain::canTransition(order.state, next)) {
    throw InvariantViolation(std::string("illegal transition ") +
                                 domain::toString(order.state) + " -> " +
                                 domain::toString(next),
                             order.id, bar_time_ms, snapshot());
  }
  order.state = next;
}

void OrderBook::collectLevel(const Level& level,
                             std::vector<OrderId>& out) const {
  for (SlotIndex slot : level) {
    out.push_back(arena_[slot].order.id);
  }
}

}  // namespace ordersim
