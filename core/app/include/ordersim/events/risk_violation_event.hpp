#pragma once

#include "ordersim/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace ordersim {

// Post-trade limit breach. Receiving one puts the RiskEngine into halt.
struct RiskViolationEvent {
  std::string symbol;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
