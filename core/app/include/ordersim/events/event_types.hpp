#pragma once

#include "ordersim/domain/candle.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ordersim {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Event time. In a backtest this is the virtual bar time converted with
// ms_to_timestamp(), never the wall clock, so two runs over the same data
// publish identical event streams.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// DataErrorEvent
// -----------------------------------------------------------------------------
// Published when a bar for one symbol is rejected (malformed or out of
// order). The bar is skipped for that symbol only; the run continues.
// -----------------------------------------------------------------------------
struct DataErrorEvent {
  std::string symbol;
  domain::Candle candle;
  domain::CandleError error{domain::CandleError::NonFinitePrice};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// BarProcessedEvent
// -----------------------------------------------------------------------------
// Published once per accepted bar after fills, marks and strategy decisions
// have been applied. Carries the portfolio totals at the close of the bar.
// -----------------------------------------------------------------------------
struct BarProcessedEvent {
  std::string symbol;
  std::int64_t datetime_ms{0};
  std::size_t fill_count{0};
  double cash{0.0};
  double equity{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace ordersim
