#include "ordersim/strategy/strategy_registry.hpp"
#include "ordersim/config/config_error.hpp"
#include "ordersim/strategy/breakout_strategy.hpp"
#include "ordersim/strategy/grid_strategy.hpp"

#include <string>
#include <utility>

namespace ordersim {

namespace {

const nlohmann::json& paramsObject(const nlohmann::json& params) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (params.is_null()) {
    return kEmpty;
  }
  if (!params.is_object()) {
    throw ConfigError("strategy params must be an object");
  }
  return params;
}

std::unique_ptr<IStrategy> makeGrid(const nlohmann::json& raw) {
  const nlohmann::json& params = paramsObject(raw);
  GridParams p;
  try {
    p.levels = params.value("levels", p.levels);
    p.spacing = params.value("spacing", p.spacing);
    p.quantity = params.value("quantity", p.quantity);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("grid params: ") + e.what());
  }
  if (p.levels == 0 || p.spacing <= 0.0 || p.spacing >= 1.0 ||
      p.quantity <= 0.0) {
    throw ConfigError(
        "grid params: need levels > 0, 0 < spacing < 1, quantity > 0");
  }
  return std::make_unique<GridStrategy>(p);
}

std::unique_ptr<IStrategy> makeBreakout(const nlohmann::json& raw) {
  const nlohmann::json& params = paramsObject(raw);
  BreakoutParams p;
  try {
    p.lookback = params.value("lookback", p.lookback);
    p.quantity = params.value("quantity", p.quantity);
    p.stop_loss = params.value("stop_loss", p.stop_loss);
    p.trend_timeframe = params.value("trend_timeframe", p.trend_timeframe);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("breakout params: ") + e.what());
  }
  if (p.lookback == 0 || p.quantity <= 0.0 || p.stop_loss <= 0.0 ||
      p.stop_loss >= 1.0) {
    throw ConfigError(
        "breakout params: need lookback > 0, quantity > 0, "
        "0 < stop_loss < 1");
  }
  return std::make_unique<BreakoutStrategy>(std::move(p));
}

}  // namespace

const char* toString(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::Grid:     return "Grid";
    case StrategyKind::Breakout: return "Breakout";
  }
  return "Unknown";
}

StrategyRegistry StrategyRegistry::withBuiltins() {
  StrategyRegistry registry;
  registry.add("grid", Entry{StrategyKind::Grid,
                             "limit-buy ladder below the close, take profit "
                             "above entry",
                             makeGrid});
  registry.add("breakout", Entry{StrategyKind::Breakout,
                                 "stop entry at the window high, protective "
                                 "stop below entry",
                                 makeBreakout});
  return registry;
}

void StrategyRegistry::add(const std::string& name, Entry entry) {
  entries_[name] = std::move(entry);
}

std::unique_ptr<IStrategy> StrategyRegistry::create(
    const std::string& name, const nlohmann::json& params) const {
  const Entry* found = entry(name);
  if (found == nullptr) {
    throw ConfigError("unknown strategy '" + name + "'");
  }
  return found->factory(params);
}

bool StrategyRegistry::contains(const std::string& name) const {
  return entries_.count(name) > 0;
}

std::vector<std::string> StrategyRegistry::names() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    result.push_back(name);
  }
  return result;
}

const StrategyRegistry::Entry* StrategyRegistry::entry(
    const std::string& name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace ordersim
