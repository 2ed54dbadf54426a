#pragma once

#include "ordersim/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace ordersim {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges the engine's int64 epoch-millisecond clock and the chrono
//         Timestamp carried by events, plus the UTC day arithmetic used for
//         Day time-in-force.
//
// Thread-safety: stateless.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerDay = 86'400'000;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// utc_day(ms)
// -------------------------------------------------------------------------
// @brief  Index of the UTC calendar day containing ms (days since epoch).
//
// @details
// Floor division, so pre-epoch timestamps land on the correct (negative)
// day rather than being truncated toward zero.
// -------------------------------------------------------------------------
inline std::int64_t utc_day(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace ordersim
