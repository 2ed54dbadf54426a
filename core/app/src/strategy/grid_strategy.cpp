#include "ordersim/strategy/grid_strategy.hpp"

#include <algorithm>
#include <utility>

namespace ordersim {

GridStrategy::GridStrategy(GridParams params) : params_(params) {}

StrategyDecision GridStrategy::onBar(const StrategyContext& context) {
  StrategyDecision decision;
  if (context.candles.empty()) {
    return decision;
  }

  const auto has_open = [&](domain::Side side) {
    return std::any_of(context.open_orders.begin(), context.open_orders.end(),
                       [side](const domain::Order& o) { return o.side == side; });
  };

  const double close = context.candles.back().close;

  if (!has_open(domain::Side::Buy)) {
    for (std::size_t k = 1; k <= params_.levels; ++k) {
      const double price = close * (1.0 - static_cast<double>(k) * params_.spacing);
      if (price <= 0.0) {
        break;
      }
      auto request = domain::OrderRequest::limit(
          context.symbol, domain::Side::Buy, params_.quantity, price);
      request.strategy_id = name();
      decision.orders.push_back(std::move(request));
    }
  }

  const domain::Position& pos = context.position;
  if (pos.quantity > domain::kQuantityEpsilon && !has_open(domain::Side::Sell)) {
    auto request = domain::OrderRequest::limit(
        context.symbol, domain::Side::Sell, pos.quantity,
        pos.average_entry_price * (1.0 + params_.spacing));
    request.strategy_id = name();
    decision.orders.push_back(std::move(request));
  }

  return decision;
}

}  // namespace ordersim
