#pragma once

#include "ordersim/book/order_book.hpp"
#include "ordersim/concurrent/order_id_generator.hpp"
#include "ordersim/config/backtest_config.hpp"
#include "ordersim/domain/candle.hpp"
#include "ordersim/domain/fill.hpp"
#include "ordersim/domain/order.hpp"
#include "ordersim/domain/order_request.hpp"
#include "ordersim/domain/position.hpp"
#include "ordersim/eventbus/event_bus.hpp"
#include "ordersim/execution/execution_engine.hpp"
#include "ordersim/persistence/checkpoint.hpp"
#include "ordersim/portfolio/position_manager.hpp"
#include "ordersim/risk/i_reconciler.hpp"
#include "ordersim/risk/risk_engine.hpp"
#include "ordersim/strategy/i_strategy.hpp"
#include "ordersim/strategy/strategy_registry.hpp"
#include "ordersim/time/simulation_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ordersim {

// Candles per symbol, each vector in increasing timestamp order.
using CandleHistory = std::map<std::string, std::vector<domain::Candle>>;

// Higher-timeframe candles: symbol -> timeframe tag -> candles in increasing
// timestamp order. Each candle is stamped with the time it became known.
using TimeframeHistory = std::map<std::string, CandleHistory>;

struct EquityPoint {
  std::int64_t timestamp_ms{0};
  double equity{0.0};
};

// -----------------------------------------------------------------------------
// BacktestResult — summary of one run
// -----------------------------------------------------------------------------
struct BacktestResult {
  std::vector<domain::Fill> fills;          // Every fill, in emission order
  std::vector<EquityPoint> equity_curve;    // One point per accepted bar
  std::vector<domain::Position> positions;  // Final snapshots, by symbol
  double initial_capital{0.0};
  double final_cash{0.0};
  double final_equity{0.0};
  std::size_t bars_processed{0};
  std::size_t orders_submitted{0};   // Every submit() call, accepted or not
  std::size_t orders_rejected{0};
  std::size_t data_errors{0};

  double totalCommission() const;
  double netPnl() const { return final_equity - initial_capital; }
};

// -----------------------------------------------------------------------------
// Backtester — per-bar driver of one simulation run
// -----------------------------------------------------------------------------
//
// @brief  Owns one complete, isolated simulation: order books, fill engine,
//         positions, risk, strategy, virtual clock and event bus.
//
// @details
// onCandle(symbol, candle) performs, in order:
//
//   1. Reject a bar that is not strictly later than the previous bar of the
//      same symbol (CandleError::OutOfOrder).
//   2. Advance the virtual clock to the bar time.
//   3. ExecutionEngine::processBar on the symbol's book. A malformed candle
//      stops here for that symbol only.
//   4. Net every fill into positions and cash:
//        buy:  cash -= price * qty + commission
//        sell: cash += price * qty - commission
//   5. Mark the symbol to the bar close and record an equity point.
//   6. Ask the strategy for a decision; apply its cancels, then submit its
//      orders. New orders are first eligible on the next bar of the symbol.
//
// submit() validates first (RejectReason from validateOrder), then asks the
// RiskEngine, then inserts into the book. A rejected request consumes no id.
//
// Events published on eventBus(), all timestamped with virtual bar time:
//   OrderUpdateEvent, OrderRejectedEvent, FillEvent, PositionUpdateEvent,
//   DataErrorEvent, BarProcessedEvent and (from the RiskEngine)
//   RiskViolationEvent.
//
// Thread model:
//   Not thread-safe. Every method must be called from one thread at a time;
//   the live driver calls onCandle() from the gateway thread and reads
//   results only after that thread has been joined. Separate Backtesters
//   share nothing and may run on separate threads (see ParallelRunner).
//
// Ownership:
//   Backtester
//    ├── config_       (BacktestConfig, copied)
//    ├── ids_          (OrderIdGenerator, shared by this run's books only)
//    ├── clock_        (SimulationTimeProvider)
//    ├── execution_    (ExecutionEngine)
//    ├── positions_    (PositionManager)
//    ├── bus_          (EventBus)
//    ├── risk_         (RiskEngine; references bus_ and positions_)
//    ├── books_        (one OrderBook per symbol, created on first use)
//    ├── windows_      (primary candle window per symbol)
//    ├── timeframe_windows_ (higher-timeframe windows per symbol)
//    └── strategy_     (unique_ptr<IStrategy>, may be null)
// -----------------------------------------------------------------------------
class Backtester {
 public:
  // Runs without a strategy unless one is given; orders come from submit().
  explicit Backtester(BacktestConfig config,
                      std::unique_ptr<IStrategy> strategy = nullptr);

  // Builds the strategy named in config through `registry`.
  // Throws ConfigError if the name is unknown or its params are invalid.
  Backtester(const BacktestConfig& config, const StrategyRegistry& registry);

  ~Backtester();

  Backtester(const Backtester&) = delete;
  Backtester& operator=(const Backtester&) = delete;
  Backtester(Backtester&&) = delete;
  Backtester& operator=(Backtester&&) = delete;

  // -------------------------------------------------------------------------
  // submit(request)
  // -------------------------------------------------------------------------
  // @return Accepted SubmitResult with the new id, or a rejection carrying
  //         its RejectReason. Never throws for a bad request.
  // -------------------------------------------------------------------------
  SubmitResult submit(const domain::OrderRequest& request);

  // -------------------------------------------------------------------------
  // cancel(id)
  // -------------------------------------------------------------------------
  // @brief  Cancels an open order at the current virtual time. A cancel
  //         issued before a bar's fill pass guarantees no fill on that bar.
  // -------------------------------------------------------------------------
  CancelResult cancel(domain::OrderId id);

  // -------------------------------------------------------------------------
  // onCandle(symbol, candle)
  // -------------------------------------------------------------------------
  // @brief  Processes one bar of one symbol (see class comment).
  //
  // @return The fill pass report. report.data_error is set when the bar was
  //         rejected; the run continues either way.
  //
  // @throws InvariantViolation from the book if the simulation state is
  //         corrupt. Not caught here.
  // -------------------------------------------------------------------------
  BarReport onCandle(const std::string& symbol, const domain::Candle& candle);

  // -------------------------------------------------------------------------
  // onCandle(symbol, timeframe, candle)
  // -------------------------------------------------------------------------
  // @brief  Appends a higher-timeframe bar to the symbol's window for
  //         `timeframe`, which strategies see as StrategyContext::timeframes.
  //         No fills, no clock movement, no strategy call. An empty tag is
  //         the primary timeframe and forwards to onCandle(symbol, candle).
  //
  // @return Empty report, or one with data_error set when the bar is
  //         malformed or not later than the previous bar of the same
  //         (symbol, timeframe).
  // -------------------------------------------------------------------------
  BarReport onCandle(const std::string& symbol, const std::string& timeframe,
                     const domain::Candle& candle);

  // -------------------------------------------------------------------------
  // run(history)
  // -------------------------------------------------------------------------
  // @brief  Feeds every candle of every symbol through onCandle(), merged by
  //         timestamp with ties broken by symbol name, and returns result().
  // -------------------------------------------------------------------------
  BacktestResult run(const CandleHistory& history);

  // As run(history), with higher-timeframe bars interleaved by timestamp.
  // At equal timestamps and symbol, higher-timeframe bars go first so the
  // strategy sees them together with the primary bar.
  BacktestResult run(const CandleHistory& history,
                     const TimeframeHistory& higher_timeframes);

  domain::Position position(const std::string& symbol) const;
  std::vector<domain::Position> positions() const;

  // Open orders of every symbol (symbol order, then sequence order).
  std::vector<domain::Order> openOrders() const;
  std::vector<domain::Order> openOrders(const std::string& symbol) const;

  // Active or terminal order by id; nullptr if never accepted.
  const domain::Order* findOrder(domain::OrderId id) const;

  double cash() const { return cash_; }

  // cash + sum(quantity * mark) over all positions.
  double equity() const;

  std::int64_t now_ms() const { return clock_.now_ms(); }

  // Snapshot of open orders, positions and cash at the current bar time.
  Checkpoint checkpoint() const;

  // -------------------------------------------------------------------------
  // restore(reconciler)
  // -------------------------------------------------------------------------
  // @brief  Hydrates positions, open orders and cash before the first bar.
  //
  // @throws std::logic_error if a bar has already been processed;
  //         std::invalid_argument (from the book) for an unusable order.
  // -------------------------------------------------------------------------
  void restore(IReconciler& reconciler);

  BacktestResult result() const;

  EventBus& eventBus() { return bus_; }
  RiskEngine& riskEngine() { return risk_; }
  const BacktestConfig& config() const { return config_; }

 private:
  OrderBook& bookFor(const std::string& symbol);
  const OrderBook* findBook(const std::string& symbol) const;

  SubmitResult rejectRequest(const domain::OrderRequest& request,
                             domain::RejectReason reason);
  void reportDataError(const std::string& symbol, const domain::Candle& candle,
                       domain::CandleError error);
  void settleFill(const domain::Fill& fill);
  void runStrategy(const std::string& symbol);

  // Signed remaining quantity of open orders of `symbol` on `side`.
  double pendingSignedQuantity(const std::string& symbol,
                               domain::Side side) const;

  Timestamp eventTime() const;
  std::uint64_t nextSequence() { return next_event_seq_++; }

  BacktestConfig config_;
  OrderIdGenerator ids_;
  SimulationTimeProvider clock_;
  ExecutionEngine execution_;
  PositionManager positions_;
  EventBus bus_;
  RiskEngine risk_;

  std::map<std::string, std::unique_ptr<OrderBook>> books_;
  std::unordered_map<domain::OrderId, std::string> order_symbol_;
  std::map<std::string, std::deque<domain::Candle>> windows_;
  std::unordered_map<std::string, std::int64_t> last_bar_ms_;
  std::map<std::string, TimeframeWindows> timeframe_windows_;
  std::map<std::pair<std::string, std::string>, std::int64_t>
      last_timeframe_bar_ms_;

  std::unique_ptr<IStrategy> strategy_;

  double cash_{0.0};
  std::vector<domain::Fill> fills_;
  std::vector<EquityPoint> equity_curve_;
  std::size_t bars_processed_{0};
  std::size_t orders_submitted_{0};
  std::size_t orders_rejected_{0};
  std::size_t data_errors_{0};
  std::uint64_t next_event_seq_{1};
};

}  // namespace ordersim
