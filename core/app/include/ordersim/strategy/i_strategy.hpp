#pragma once

#include "ordersim/domain/candle.hpp"
#include "ordersim/domain/order.hpp"
#include "ordersim/domain/order_request.hpp"
#include "ordersim/domain/position.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace ordersim {

// Candle windows of one symbol keyed by timeframe tag ("1h", "1d", ...).
// Each window is oldest first.
using TimeframeWindows = std::map<std::string, std::deque<domain::Candle>>;

// -----------------------------------------------------------------------------
// StrategyContext — read-only view handed to a strategy once per bar
// -----------------------------------------------------------------------------
// Every member refers to Backtester state that is valid only for the
// duration of the onBar() call. Strategies copy what they want to keep.
//
// `candles` is the primary timeframe, the one that drives fills. `timeframes`
// holds the higher-timeframe windows fed for this symbol, each ending at the
// latest bar stamped at or before now_ms; it is null when none were fed.
// -----------------------------------------------------------------------------
struct StrategyContext {
  const std::string& symbol;
  const std::deque<domain::Candle>& candles;   // Oldest first, current last
  const domain::Position& position;
  const std::vector<domain::Order>& open_orders;  // This symbol only
  double cash{0.0};
  double equity{0.0};
  std::int64_t now_ms{0};
  const TimeframeWindows* timeframes{nullptr};

  // Window for `tag`, or nullptr if that timeframe was never fed.
  const std::deque<domain::Candle>* timeframe(const std::string& tag) const {
    if (timeframes == nullptr) {
      return nullptr;
    }
    auto it = timeframes->find(tag);
    return it == timeframes->end() ? nullptr : &it->second;
  }
};

// What a strategy wants done after the current bar. Cancels are applied
// before new orders; new orders are first eligible on the next bar.
struct StrategyDecision {
  std::vector<domain::OrderRequest> orders;
  std::vector<domain::OrderId> cancels;

  bool empty() const { return orders.empty() && cancels.empty(); }
};

// -----------------------------------------------------------------------------
// IStrategy
// -----------------------------------------------------------------------------
//
// @brief  Turns market context into order requests. Never touches the book,
//         positions or the bus directly.
//
// @details
// One instance per Backtester; it is called for every accepted bar of every
// symbol, always from the thread driving that Backtester, so per-symbol
// state may live in plain members.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual std::string name() const = 0;

  virtual StrategyDecision onBar(const StrategyContext& context) = 0;
};

}  // namespace ordersim
