#pragma once

#include "ordersim/domain/position.hpp"
#include "ordersim/events/event_types.hpp"

namespace ordersim {

struct PositionUpdateEvent {
  domain::Position position;   // Snapshot after the fill was netted
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
