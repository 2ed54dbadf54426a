#pragma once

#include "ordersim/config/backtest_config.hpp"
#include "ordersim/engine/backtester.hpp"
#include "ordersim/strategy/strategy_registry.hpp"

#include <cstddef>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// ParallelRunner — many independent backtests over one candle history
// -----------------------------------------------------------------------------
//
// @brief  Runs one Backtester per config on a fixed pool of worker threads,
//         e.g. for a parameter grid.
//
// @details
// Job indices are pushed into a ThreadSafeQueue which is then closed; each
// worker pops indices until the queue is drained. A job builds its own
// Backtester (own books, ids, positions, clock and bus) from its config and
// the registry, so the only state shared across threads is the read-only
// history, config list and registry.
//
// Results come back in config order regardless of which worker ran which
// job. Each run is deterministic, so the results do not depend on the
// worker count.
//
// If any job throws, every worker is still joined and the exception of the
// lowest failing index is rethrown from run().
//
// Thread model:
//   run() blocks the caller until all workers have been joined.
// -----------------------------------------------------------------------------
class ParallelRunner {
 public:
  // workers == 0 uses std::thread::hardware_concurrency() (at least 1).
  explicit ParallelRunner(const StrategyRegistry& registry,
                          std::size_t workers = 0);

  std::vector<BacktestResult> run(
      const CandleHistory& history,
      const std::vector<BacktestConfig>& configs) const;

  std::size_t workers() const { return workers_; }

 private:
  const StrategyRegistry& registry_;
  std::size_t workers_;
};

}  // namespace ordersim
