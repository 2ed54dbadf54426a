#include "ordersim/config/backtest_config.hpp"
#include "ordersim/config/config_error.hpp"

#include <fstream>

namespace ordersim {

namespace {

void parseExecution(const nlohmann::json& j, ExecutionConfig& out) {
  out.slippage = j.value("slippage", out.slippage);
  out.maker_commission_rate =
      j.value("maker_commission_rate", out.maker_commission_rate);
  out.taker_commission_rate =
      j.value("taker_commission_rate", out.taker_commission_rate);
  auto cap = j.find("volume_cap_fraction");
  if (cap != j.end() && !cap->is_null()) {
    out.volume_cap_fraction = cap->get<double>();
  }
}

void parseRisk(const nlohmann::json& j, domain::RiskLimits& out) {
  out.max_position_per_symbol =
      j.value("max_position_per_symbol", out.max_position_per_symbol);
  out.max_drawdown = j.value("max_drawdown", out.max_drawdown);
}

void validate(const BacktestConfig& config) {
  const ExecutionConfig& exec = config.execution;
  if (config.initial_capital <= 0.0) {
    throw ConfigError("initial_capital must be positive");
  }
  if (config.history_window == 0) {
    throw ConfigError("history_window must be positive");
  }
  // A sell market fill is priced at open * (1 - slippage).
  if (exec.slippage < 0.0 || exec.slippage >= 1.0) {
    throw ConfigError("execution.slippage must be in [0, 1)");
  }
  if (exec.maker_commission_rate < 0.0 || exec.taker_commission_rate < 0.0) {
    throw ConfigError("execution commission rates must not be negative");
  }
  if (exec.volume_cap_fraction &&
      (*exec.volume_cap_fraction <= 0.0 || *exec.volume_cap_fraction > 1.0)) {
    throw ConfigError("execution.volume_cap_fraction must be in (0, 1]");
  }
  if (config.risk.max_position_per_symbol <= 0.0) {
    throw ConfigError("risk.max_position_per_symbol must be positive");
  }
  if (config.risk.max_drawdown > 0.0) {
    throw ConfigError("risk.max_drawdown must be zero or negative");
  }
  if (config.strategy_name.empty()) {
    throw ConfigError("strategy.name must not be empty");
  }
}

}  // namespace

BacktestConfig parseBacktestConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("top-level document must be an object");
  }

  BacktestConfig config;
  try {
    config.initial_capital =
        document.value("initial_capital", config.initial_capital);
    config.history_window =
        document.value("history_window", config.history_window);

    if (auto it = document.find("execution"); it != document.end()) {
      parseExecution(*it, config.execution);
    }
    if (auto it = document.find("risk"); it != document.end()) {
      parseRisk(*it, config.risk);
    }
    if (auto it = document.find("strategy"); it != document.end()) {
      config.strategy_name = it->value("name", config.strategy_name);
      if (auto params = it->find("params"); params != it->end()) {
        config.strategy_params = *params;
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  }

  validate(config);
  return config;
}

BacktestConfig loadBacktestConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return parseBacktestConfig(document);
}

nlohmann::json toJson(const BacktestConfig& config) {
  nlohmann::json execution = {
      {"slippage", config.execution.slippage},
      {"maker_commission_rate", config.execution.maker_commission_rate},
      {"taker_commission_rate", config.execution.taker_commission_rate},
      {"volume_cap_fraction", nullptr},
  };
  if (config.execution.volume_cap_fraction) {
    execution["volume_cap_fraction"] = *config.execution.volume_cap_fraction;
  }

  return nlohmann::json{
      {"initial_capital", config.initial_capital},
      {"history_window", config.history_window},
      {"execution", execution},
      {"risk",
       {{"max_position_per_symbol", config.risk.max_position_per_symbol},
        {"max_drawdown", config.risk.max_drawdown}}},
      {"strategy",
       {{"name", config.strategy_name}, {"params", config.strategy_params}}},
  };
}

}  // namespace ordersim
