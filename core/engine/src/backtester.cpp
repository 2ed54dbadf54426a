#include "ordersim/engine/backtester.hpp"
#include "ordersim/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ordersim {

using domain::Candle;
using domain::Order;
using domain::OrderId;
using domain::OrderRequest;

double BacktestResult::totalCommission() const {
  double total = 0.0;
  for (const domain::Fill& fill : fills) {
    total += fill.commission;
  }
  return total;
}

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
Backtester::Backtester(BacktestConfig config,
                       std::unique_ptr<IStrategy> strategy)
    : config_(std::move(config)),
      execution_(config_.execution),
      risk_(bus_, positions_, config_.risk,
            [this] { return nextSequence(); }),
      strategy_(std::move(strategy)),
      cash_(config_.initial_capital) {}

Backtester::Backtester(const BacktestConfig& config,
                       const StrategyRegistry& registry)
    : Backtester(config,
                 registry.create(config.strategy_name, config.strategy_params)) {}

Backtester::~Backtester() = default;

// -----------------------------------------------------------------------------
// submit(): validate, risk check, then rest in the book
// -----------------------------------------------------------------------------
SubmitResult Backtester::submit(const OrderRequest& request) {
  ++orders_submitted_;

  Order order = domain::makeOrder(request, clock_.now_ms());
  if (order.time_in_force == domain::TimeInForce::Day && bars_processed_ > 0) {
    order.session_day = utc_day(clock_.now_ms());
  }
  if (auto reason = domain::validateOrder(order)) {
    return rejectRequest(request, *reason);
  }
  if (auto reason = risk_.check(
          request, pendingSignedQuantity(request.symbol, request.side))) {
    return rejectRequest(request, *reason);
  }

  SubmitResult result = bookFor(request.symbol).insert(std::move(order));
  if (!result.accepted()) {
    return rejectRequest(request, *result.reject_reason);
  }

  order_symbol_[*result.id] = request.symbol;

  OrderUpdateEvent update;
  update.order = result.order;
  update.previous_state = domain::OrderState::New;
  update.timestamp = eventTime();
  update.sequence_id = nextSequence();
  bus_.publish(update);

  return result;
}

SubmitResult Backtester::rejectRequest(const OrderRequest& request,
                                       domain::RejectReason reason) {
  ++orders_rejected_;
  std::cerr << "[Backtester] Rejected " << domain::toString(request.side)
            << " " << domain::toString(request.kind) << " "
            << request.quantity << " " << request.symbol << ": "
            << domain::toString(reason) << "\n";

  OrderRejectedEvent rejected;
  rejected.request = request;
  rejected.reason = reason;
  rejected.timestamp = eventTime();
  rejected.sequence_id = nextSequence();
  bus_.publish(rejected);

  return SubmitResult::reject(domain::makeOrder(request, clock_.now_ms()),
                              reason);
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
CancelResult Backtester::cancel(OrderId id) {
  auto it = order_symbol_.find(id);
  if (it == order_symbol_.end()) {
    return CancelResult::UnknownOrder;
  }

  OrderBook& book = bookFor(it->second);
  const Order* before = book.find(id);
  if (before == nullptr) {
    return CancelResult::UnknownOrder;
  }
  const domain::OrderState previous = before->state;

  CancelResult result = book.cancel(id, clock_.now_ms());
  if (result == CancelResult::Ok) {
    OrderUpdateEvent update;
    update.order = *book.find(id);
    update.previous_state = previous;
    update.timestamp = eventTime();
    update.sequence_id = nextSequence();
    bus_.publish(update);
  }
  return result;
}

// -----------------------------------------------------------------------------
// onCandle(): one bar of one symbol
// -----------------------------------------------------------------------------
BarReport Backtester::onCandle(const std::string& symbol,
                               const Candle& candle) {
  auto last = last_bar_ms_.find(symbol);
  if (last != last_bar_ms_.end() && candle.datetime_ms <= last->second) {
    BarReport report;
    report.data_error = domain::CandleError::OutOfOrder;
    reportDataError(symbol, candle, domain::CandleError::OutOfOrder);
    return report;
  }

  // Bars of different symbols may interleave slightly out of order on a live
  // feed; the clock never moves backwards.
  if (candle.datetime_ms > clock_.now_ms()) {
    clock_.advance_time(candle.datetime_ms);
  }

  OrderBook& book = bookFor(symbol);
  BarReport report = execution_.processBar(candle, book);
  if (!report.ok()) {
    reportDataError(symbol, candle, *report.data_error);
    return report;
  }

  last_bar_ms_[symbol] = candle.datetime_ms;
  ++bars_processed_;

  for (const domain::Fill& fill : report.fills) {
    settleFill(fill);
  }
  for (const OrderTransition& transition : report.transitions) {
    if (transition.order.state == domain::OrderState::Expired) {
      std::cout << "[Backtester] Order " << transition.order.id << " ("
                << symbol << ") expired at " << candle.datetime_ms << "\n";
    }
    OrderUpdateEvent update;
    update.order = transition.order;
    update.previous_state = transition.previous_state;
    update.timestamp = eventTime();
    update.sequence_id = nextSequence();
    bus_.publish(update);
  }

  positions_.markPrice(symbol, candle.close);

  std::deque<Candle>& window = windows_[symbol];
  window.push_back(candle);
  while (window.size() > config_.history_window) {
    window.pop_front();
  }

  equity_curve_.push_back(EquityPoint{candle.datetime_ms, equity()});

  runStrategy(symbol);

  BarProcessedEvent processed;
  processed.symbol = symbol;
  processed.datetime_ms = candle.datetime_ms;
  processed.fill_count = report.fills.size();
  processed.cash = cash_;
  processed.equity = equity();
  processed.timestamp = eventTime();
  processed.sequence_id = nextSequence();
  bus_.publish(processed);

  return report;
}

// -----------------------------------------------------------------------------
// onCandle(symbol, timeframe, candle): context only
// -----------------------------------------------------------------------------
BarReport Backtester::onCandle(const std::string& symbol,
                               const std::string& timeframe,
                               const Candle& candle) {
  if (timeframe.empty()) {
    return onCandle(symbol, candle);
  }

  BarReport report;
  const auto key = std::make_pair(symbol, timeframe);
  auto last = last_timeframe_bar_ms_.find(key);
  if (last != last_timeframe_bar_ms_.end() &&
      candle.datetime_ms <= last->second) {
    report.data_error = domain::CandleError::OutOfOrder;
  } else {
    report.data_error = domain::validateCandle(candle);
  }
  if (report.data_error) {
    reportDataError(symbol, candle, *report.data_error);
    return report;
  }

  last_timeframe_bar_ms_[key] = candle.datetime_ms;
  std::deque<Candle>& window = timeframe_windows_[symbol][timeframe];
  window.push_back(candle);
  while (window.size() > config_.history_window) {
    window.pop_front();
  }
  return report;
}

void Backtester::reportDataError(const std::string& symbol,
                                 const Candle& candle,
                                 domain::CandleError error) {
  ++data_errors_;
  std::cerr << "[Backtester] Skipping bar " << candle.datetime_ms << " for "
            << symbol << ": " << domain::toString(error) << "\n";

  DataErrorEvent event;
  event.symbol = symbol;
  event.candle = candle;
  event.error = error;
  event.timestamp = eventTime();
  event.sequence_id = nextSequence();
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// settleFill(): cash, position, events
// -----------------------------------------------------------------------------
void Backtester::settleFill(const domain::Fill& fill) {
  if (fill.side == domain::Side::Buy) {
    cash_ -= fill.notional() + fill.commission;
  } else {
    cash_ += fill.notional() - fill.commission;
  }
  fills_.push_back(fill);

  FillEvent fill_event;
  fill_event.fill = fill;
  fill_event.timestamp = eventTime();
  fill_event.sequence_id = nextSequence();
  bus_.publish(fill_event);

  PositionUpdateEvent update;
  update.position = positions_.apply(fill);
  update.timestamp = eventTime();
  update.sequence_id = nextSequence();
  bus_.publish(update);
}

// -----------------------------------------------------------------------------
// runStrategy(): context in, cancels then submissions out
// -----------------------------------------------------------------------------
void Backtester::runStrategy(const std::string& symbol) {
  if (!strategy_) {
    return;
  }

  const domain::Position position = positions_.position(symbol);
  const std::vector<Order> open = openOrders(symbol);
  auto higher = timeframe_windows_.find(symbol);
  StrategyContext context{symbol,   windows_[symbol], position, open,
                          cash_,    equity(),         clock_.now_ms(),
                          higher == timeframe_windows_.end() ? nullptr
                                                             : &higher->second};

  StrategyDecision decision = strategy_->onBar(context);

  for (OrderId id : decision.cancels) {
    CancelResult result = cancel(id);
    if (result != CancelResult::Ok) {
      std::cerr << "[Backtester] Strategy " << strategy_->name()
                << " cancel of " << id << ": " << toString(result) << "\n";
    }
  }
  for (OrderRequest& request : decision.orders) {
    if (request.symbol.empty()) {
      request.symbol = symbol;
    }
    if (request.strategy_id.empty()) {
      request.strategy_id = strategy_->name();
    }
    submit(request);
  }
}

// -----------------------------------------------------------------------------
// run(): merge symbols by (timestamp, symbol)
// -----------------------------------------------------------------------------
BacktestResult Backtester::run(const CandleHistory& history) {
  return run(history, TimeframeHistory{});
}

BacktestResult Backtester::run(const CandleHistory& history,
                               const TimeframeHistory& higher_timeframes) {
  // A null timeframe marks a primary bar.
  struct Step {
    std::int64_t ts;
    const std::string* symbol;
    const std::string* timeframe;
    const Candle* candle;
  };

  std::vector<Step> merged;
  for (const auto& [symbol, candles] : history) {
    for (const Candle& candle : candles) {
      merged.push_back(Step{candle.datetime_ms, &symbol, nullptr, &candle});
    }
  }
  for (const auto& [symbol, frames] : higher_timeframes) {
    for (const auto& [timeframe, candles] : frames) {
      for (const Candle& candle : candles) {
        merged.push_back(
            Step{candle.datetime_ms, &symbol, &timeframe, &candle});
      }
    }
  }
  // Stable so that duplicate timestamps within one series keep their input
  // order and surface as OutOfOrder data errors.
  std::stable_sort(merged.begin(), merged.end(),
                   [](const Step& a, const Step& b) {
                     if (a.ts != b.ts) {
                       return a.ts < b.ts;
                     }
                     if (*a.symbol != *b.symbol) {
                       return *a.symbol < *b.symbol;
                     }
                     if ((a.timeframe == nullptr) != (b.timeframe == nullptr)) {
                       return a.timeframe != nullptr;
                     }
                     return a.timeframe != nullptr &&
                            *a.timeframe < *b.timeframe;
                   });

  std::cout << "[Backtester] Running " << merged.size() << " bars over "
            << history.size() << " symbol(s)"
            << (strategy_ ? " with strategy " + strategy_->name() : "")
            << "\n";

  for (const Step& step : merged) {
    if (step.timeframe == nullptr) {
      onCandle(*step.symbol, *step.candle);
    } else {
      onCandle(*step.symbol, *step.timeframe, *step.candle);
    }
  }

  BacktestResult summary = result();
  std::cout << "[Backtester] Done: " << summary.bars_processed << " bars, "
            << summary.fills.size() << " fills, "
            << summary.orders_rejected << " rejections, "
            << summary.data_errors << " data errors, final equity "
            << summary.final_equity << "\n";
  return summary;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
domain::Position Backtester::position(const std::string& symbol) const {
  return positions_.position(symbol);
}

std::vector<domain::Position> Backtester::positions() const {
  return positions_.positions();
}

std::vector<Order> Backtester::openOrders() const {
  std::vector<Order> result;
  for (const auto& [symbol, book] : books_) {
    std::vector<Order> open = book->openOrders();
    result.insert(result.end(), open.begin(), open.end());
  }
  return result;
}

std::vector<Order> Backtester::openOrders(const std::string& symbol) const {
  const OrderBook* book = findBook(symbol);
  return book ? book->openOrders() : std::vector<Order>{};
}

const Order* Backtester::findOrder(OrderId id) const {
  auto it = order_symbol_.find(id);
  if (it == order_symbol_.end()) {
    return nullptr;
  }
  const OrderBook* book = findBook(it->second);
  return book ? book->find(id) : nullptr;
}

double Backtester::equity() const { return cash_ + positions_.marketValue(); }

BacktestResult Backtester::result() const {
  BacktestResult summary;
  summary.fills = fills_;
  summary.equity_curve = equity_curve_;
  summary.positions = positions_.positions();
  summary.initial_capital = config_.initial_capital;
  summary.final_cash = cash_;
  summary.final_equity = equity();
  summary.bars_processed = bars_processed_;
  summary.orders_submitted = orders_submitted_;
  summary.orders_rejected = orders_rejected_;
  summary.data_errors = data_errors_;
  return summary;
}

// -----------------------------------------------------------------------------
// checkpoint() / restore()
// -----------------------------------------------------------------------------
Checkpoint Backtester::checkpoint() const {
  Checkpoint cp;
  cp.timestamp_ms = clock_.now_ms();
  cp.open_orders = openOrders();
  cp.positions = positions_.positions();
  cp.cash = cash_;
  return cp;
}

void Backtester::restore(IReconciler& reconciler) {
  if (bars_processed_ > 0) {
    throw std::logic_error(
        "Backtester::restore() called after bars were processed");
  }

  auto positions = reconciler.reconcilePositions();
  for (const auto& pos : positions) {
    positions_.hydratePosition(pos);
  }

  auto orders = reconciler.reconcileOrders();
  for (const auto& order : orders) {
    bookFor(order.symbol).hydrate(order);
    order_symbol_[order.id] = order.symbol;
  }

  if (auto cash = reconciler.reconcileCash()) {
    cash_ = *cash;
  }

  std::cout << "[Backtester] Reconciliation complete: " << positions.size()
            << " position(s), " << orders.size()
            << " open order(s) hydrated, cash " << cash_ << "\n";
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
OrderBook& Backtester::bookFor(const std::string& symbol) {
  auto it = books_.find(symbol);
  if (it == books_.end()) {
    it = books_.emplace(symbol, std::make_unique<OrderBook>(symbol, ids_))
             .first;
  }
  return *it->second;
}

const OrderBook* Backtester::findBook(const std::string& symbol) const {
  auto it = books_.find(symbol);
  return it == books_.end() ? nullptr : it->second.get();
}

double Backtester::pendingSignedQuantity(const std::string& symbol,
                                         domain::Side side) const {
  const OrderBook* book = findBook(symbol);
  if (book == nullptr) {
    return 0.0;
  }
  double pending = 0.0;
  for (const Order& order : book->openOrders()) {
    if (order.side == side) {
      pending += domain::sideSign(side) * order.remaining();
    }
  }
  return pending;
}

Timestamp Backtester::eventTime() const {
  return ms_to_timestamp(clock_.now_ms());
}

}  // namespace ordersim
