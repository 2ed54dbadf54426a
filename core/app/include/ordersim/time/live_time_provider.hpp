#pragma once

#include "ordersim/time/i_time_provider.hpp"

namespace ordersim {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall clock
// -----------------------------------------------------------------------------
// Only used outside the simulation path: the candle feed gateway measures its
// circuit-breaker cool-down with it. std::chrono::system_clock::now() is safe
// from any thread, so there is no state to protect.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace ordersim
