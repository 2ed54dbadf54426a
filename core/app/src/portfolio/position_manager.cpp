#include "ordersim/portfolio/position_manager.hpp"

#include <cmath>

namespace ordersim {

// -----------------------------------------------------------------------------
// apply: net on a copy, commit with one assignment
// -----------------------------------------------------------------------------
domain::Position PositionManager::apply(const domain::Fill& fill) {
  auto it = positions_.find(fill.symbol);
  domain::Position current;
  if (it != positions_.end()) {
    current = it->second;
  } else {
    current.symbol = fill.symbol;
  }

  domain::Position next = netFill(current, fill);
  marks_[fill.symbol] = fill.price;
  positions_[fill.symbol] = next;
  return withMark(next);
}

void PositionManager::markPrice(const std::string& symbol, double price) {
  marks_[symbol] = price;
}

domain::Position PositionManager::position(const std::string& symbol) const {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    domain::Position flat;
    flat.symbol = symbol;
    auto mark = marks_.find(symbol);
    if (mark != marks_.end()) {
      flat.last_price = mark->second;
    }
    return flat;
  }
  return withMark(it->second);
}

std::vector<domain::Position> PositionManager::positions() const {
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(withMark(pos));
  }
  return result;
}

double PositionManager::totalRealizedPnl() const {
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.realized_pnl;
  }
  return total;
}

double PositionManager::totalUnrealizedPnl() const {
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += withMark(pos).unrealized_pnl;
  }
  return total;
}

double PositionManager::marketValue() const {
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.quantity * withMark(pos).last_price;
  }
  return total;
}

void PositionManager::hydratePosition(const domain::Position& position) {
  positions_[position.symbol] = position;
  if (position.last_price > 0.0) {
    marks_[position.symbol] = position.last_price;
  }
}

domain::Position PositionManager::withMark(
    const domain::Position& position) const {
  domain::Position snapshot = position;
  auto it = marks_.find(position.symbol);
  if (it != marks_.end()) {
    snapshot.last_price = it->second;
  }
  snapshot.unrealized_pnl =
      snapshot.isFlat()
          ? 0.0
          : (snapshot.last_price - snapshot.average_entry_price) *
                snapshot.quantity;
  return snapshot;
}

// -----------------------------------------------------------------------------
// netFill: core PnL math (static, pure)
// -----------------------------------------------------------------------------
domain::Position PositionManager::netFill(const domain::Position& current,
                                          const domain::Fill& fill) {
  domain::Position pos = current;
  const double current_qty = current.quantity;
  const double signed_fill_qty = fill.signedQuantity();
  const double price = fill.price;

  pos.total_commission += fill.commission;
  pos.realized_pnl -= fill.commission;
  pos.last_price = price;
  pos.updated_at_ms = fill.timestamp_ms;

  const bool same_direction =
      (current_qty > 0.0 && signed_fill_qty > 0.0) ||
      (current_qty < 0.0 && signed_fill_qty < 0.0);

  if (current_qty == 0.0 || same_direction) {
    // ----- Case 1: opening or increasing -------------------------------------
    const double abs_current = std::abs(current_qty);
    const double abs_fill = std::abs(signed_fill_qty);
    pos.average_entry_price =
        (abs_current * current.average_entry_price + abs_fill * price) /
        (abs_current + abs_fill);
    pos.quantity = current_qty + signed_fill_qty;
    if (current_qty == 0.0) {
      pos.opened_at_ms = fill.timestamp_ms;
    }
    return pos;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(signed_fill_qty);
  // +1 closing a long, -1 closing a short.
  const double direction_sign = current_qty > 0.0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current + domain::kQuantityEpsilon) {
    // ----- Case 2: reducing or closing ---------------------------------------
    pos.realized_pnl +=
        abs_fill * (price - current.average_entry_price) * direction_sign;
    pos.quantity = current_qty + signed_fill_qty;
    if (std::abs(pos.quantity) <= domain::kQuantityEpsilon) {
      pos.quantity = 0.0;
      pos.average_entry_price = 0.0;
    }
    return pos;
  }

  // ----- Case 3: reversal ------------------------------------------------------
  pos.realized_pnl +=
      abs_current * (price - current.average_entry_price) * direction_sign;
  pos.quantity = current_qty + signed_fill_qty;
  pos.average_entry_price = price;
  pos.opened_at_ms = fill.timestamp_ms;
  return pos;
}

}  // namespace ordersim
