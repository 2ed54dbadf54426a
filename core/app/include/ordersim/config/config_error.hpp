#pragma once

#include <stdexcept>
#include <string>

namespace ordersim {

// Raised for unreadable, malformed or out-of-range configuration: backtest
// config files, strategy parameters and unknown strategy names.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error("config error: " + message) {}
};

}  // namespace ordersim
