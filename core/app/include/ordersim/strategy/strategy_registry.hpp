#pragma once

#include "ordersim/strategy/i_strategy.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ordersim {

// Closed set of strategy implementations shipped with the engine.
enum class StrategyKind {
  Grid,
  Breakout,
};

const char* toString(StrategyKind kind);

// -----------------------------------------------------------------------------
// StrategyRegistry — name -> factory table
// -----------------------------------------------------------------------------
//
// @brief  Maps the strategy name of a backtest configuration to a factory
//         that builds a fresh IStrategy from JSON parameters.
//
// @details
// Built once at process start (normally with withBuiltins()) and passed by
// const reference to whoever creates Backtesters. There is no global
// instance. create() returns a new strategy per call, so parallel runs never
// share strategy state.
//
// Thread model:
//   add() is not thread-safe. After construction the registry is read-only
//   and create()/contains()/names() may be called from any thread.
// -----------------------------------------------------------------------------
class StrategyRegistry {
 public:
  using Factory =
      std::function<std::unique_ptr<IStrategy>(const nlohmann::json& params)>;

  struct Entry {
    StrategyKind kind;
    std::string description;
    Factory factory;
  };

  // Registry holding "grid" and "breakout".
  static StrategyRegistry withBuiltins();

  // Registers or replaces `name`.
  void add(const std::string& name, Entry entry);

  // -------------------------------------------------------------------------
  // create(name, params)
  // -------------------------------------------------------------------------
  // @throws ConfigError for an unknown name or parameters of the wrong type
  //         or range.
  // -------------------------------------------------------------------------
  std::unique_ptr<IStrategy> create(const std::string& name,
                                    const nlohmann::json& params) const;

  bool contains(const std::string& name) const;

  // Registered names, sorted.
  std::vector<std::string> names() const;

  const Entry* entry(const std::string& name) const;

 private:
  std::map<std::string, Entry> entries_;
};

}  // namespace ordersim
