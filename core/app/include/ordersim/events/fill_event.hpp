#pragma once

#include "ordersim/domain/fill.hpp"
#include "ordersim/events/event_types.hpp"

namespace ordersim {

struct FillEvent {
  domain::Fill fill;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
