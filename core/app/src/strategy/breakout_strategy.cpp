#include "ordersim/strategy/breakout_strategy.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace ordersim {

BreakoutStrategy::BreakoutStrategy(BreakoutParams params)
    : params_(std::move(params)) {}

bool BreakoutStrategy::trendAllowsEntry(const StrategyContext& context) const {
  if (params_.trend_timeframe.empty()) {
    return true;
  }
  const auto* trend = context.timeframe(params_.trend_timeframe);
  if (trend == nullptr || trend->empty()) {
    return false;
  }
  return trend->back().close > trend->back().open;
}

StrategyDecision BreakoutStrategy::onBar(const StrategyContext& context) {
  StrategyDecision decision;
  const auto& candles = context.candles;
  if (params_.lookback == 0 || candles.size() < params_.lookback) {
    return decision;
  }

  double window_high = 0.0;
  for (auto it = candles.end() - static_cast<std::ptrdiff_t>(params_.lookback);
       it != candles.end(); ++it) {
    window_high = std::max(window_high, it->high);
  }

  const domain::Position& pos = context.position;
  const bool long_position = pos.quantity > domain::kQuantityEpsilon;
  const bool want_entry = !long_position && trendAllowsEntry(context);

  bool entry_in_place = false;
  bool exit_in_place = false;
  for (const domain::Order& order : context.open_orders) {
    if (order.kind != domain::OrderKind::Stop) {
      continue;
    }
    if (order.side == domain::Side::Buy) {
      if (want_entry && order.stop_price == window_high) {
        entry_in_place = true;
      } else {
        decision.cancels.push_back(order.id);
      }
    } else {
      exit_in_place = true;
    }
  }

  if (want_entry && !entry_in_place) {
    auto request = domain::OrderRequest::stop(
        context.symbol, domain::Side::Buy, params_.quantity, window_high);
    request.strategy_id = name();
    decision.orders.push_back(std::move(request));
  }

  if (long_position && !exit_in_place) {
    auto request = domain::OrderRequest::stop(
        context.symbol, domain::Side::Sell, pos.quantity,
        pos.average_entry_price * (1.0 - params_.stop_loss));
    request.strategy_id = name();
    decision.orders.push_back(std::move(request));
  }

  return decision;
}

}  // namespace ordersim
