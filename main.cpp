// -----------------------------------------------------------------------------
// ordersim — single executable entry point.
//
// Live simulation mode:
//   1) Load the backtest configuration (argv[1], defaults if omitted).
//   2) Build the strategy registry and a Backtester for the configured
//      strategy.
//   3) If a checkpoint path is given (argv[3]) and the file exists, restore
//      open orders, positions and cash from it.
//   4) Subscribe logging callbacks on the Backtester's EventBus.
//   5) Run a CandleFeedGateway on the main thread; every decoded candle goes
//      straight into Backtester::onCandle.
//   6) On Ctrl-C: stop the gateway, save the checkpoint, print positions.
//
// Usage:
//   ordersim [config.json] [endpoint] [checkpoint.json]
//
// No global state apart from the signal handler's gateway pointer; the
// Backtester and gateway are stack-local in main().
// -----------------------------------------------------------------------------

#include "ordersim/config/backtest_config.hpp"
#include "ordersim/engine/backtester.hpp"
#include "ordersim/events/event.hpp"
#include "ordersim/gateway/candle_feed_gateway.hpp"
#include "ordersim/persistence/checkpoint.hpp"
#include "ordersim/strategy/strategy_registry.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// -----------------------------------------------------------------------------
// Raw pointer to the stack-local gateway so the SIGINT handler can stop its
// recv loop. Set once before the handler is installed.
// -----------------------------------------------------------------------------
static ordersim::CandleFeedGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

static void subscribeLogging(ordersim::EventBus& bus) {
  using namespace ordersim;

  bus.subscribe<OrderUpdateEvent>([](const OrderUpdateEvent& e) {
    std::cout << "[OrderUpdate] id=" << e.order.id << " " << e.order.symbol
              << " " << domain::toString(e.order.side) << " "
              << domain::toString(e.order.kind) << " "
              << domain::toString(e.previous_state) << " -> "
              << domain::toString(e.order.state)
              << " filled=" << e.order.filled_quantity << "/"
              << e.order.quantity << "\n";
  });

  bus.subscribe<FillEvent>([](const FillEvent& e) {
    std::cout << "[Fill] order_id=" << e.fill.order_id << " "
              << e.fill.symbol << " " << domain::toString(e.fill.side)
              << " qty=" << e.fill.quantity << " price=" << e.fill.price
              << " commission=" << e.fill.commission
              << (e.fill.is_maker ? " maker" : " taker") << "\n";
  });

  bus.subscribe<PositionUpdateEvent>([](const PositionUpdateEvent& e) {
    std::cout << "[PositionUpdate] symbol=" << e.position.symbol
              << " qty=" << e.position.quantity
              << " avg_price=" << e.position.average_entry_price
              << " realized_pnl=" << e.position.realized_pnl << "\n";
  });

  bus.subscribe<RiskViolationEvent>([](const RiskViolationEvent& e) {
    std::cerr << "[RiskViolation] " << e.symbol << ": " << e.reason
              << " value=" << e.current_value << " limit=" << e.limit_value
              << "\n";
  });
}

int main(int argc, char** argv) {
  try {
    // -----------------------------------------------------------------------
    // 1) Configuration
    // -----------------------------------------------------------------------
    ordersim::BacktestConfig config;
    if (argc > 1) {
      config = ordersim::loadBacktestConfig(argv[1]);
      std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
    }
    const std::string endpoint = argc > 2 ? argv[2] : "tcp://127.0.0.1:5555";

    // -----------------------------------------------------------------------
    // 2) Registry and Backtester
    // -----------------------------------------------------------------------
    const auto registry = ordersim::StrategyRegistry::withBuiltins();
    ordersim::Backtester backtester(config, registry);

    // -----------------------------------------------------------------------
    // 3) Optional restore
    // -----------------------------------------------------------------------
    std::unique_ptr<ordersim::CheckpointStore> store;
    if (argc > 3) {
      store = std::make_unique<ordersim::CheckpointStore>(argv[3]);
      if (store->exists()) {
        ordersim::CheckpointReconciler reconciler(*store);
        backtester.restore(reconciler);
      }
    }

    // -----------------------------------------------------------------------
    // 4) Logging
    // -----------------------------------------------------------------------
    subscribeLogging(backtester.eventBus());

    // -----------------------------------------------------------------------
    // 5) Gateway on the main thread
    // -----------------------------------------------------------------------
    ordersim::CandleFeedGateway gateway(
        [&backtester](const std::string& symbol,
                      const ordersim::domain::Candle& candle) {
          backtester.onCandle(symbol, candle);
        },
        endpoint);

    g_gateway_ptr = &gateway;
    std::signal(SIGINT, sigint_handler);

    std::cout << "[main] Strategy '" << config.strategy_name
              << "' waiting for candles on " << endpoint << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    gateway.run();
    g_gateway_ptr = nullptr;

    // -----------------------------------------------------------------------
    // 6) Shutdown
    // -----------------------------------------------------------------------
    std::cout << "\n[main] Gateway exited.\n";
    if (store && !store->save(backtester.checkpoint())) {
      std::cerr << "[main] Checkpoint was not saved\n";
    }

    const ordersim::BacktestResult result = backtester.result();
    for (const auto& pos : result.positions) {
      std::cout << "[main] " << pos.symbol << " qty=" << pos.quantity
                << " avg=" << pos.average_entry_price
                << " realized=" << pos.realized_pnl
                << " unrealized=" << pos.unrealized_pnl << "\n";
    }
    std::cout << "[main] bars=" << result.bars_processed
              << " fills=" << result.fills.size()
              << " cash=" << result.final_cash
              << " equity=" << result.final_equity << "\n";
    return 0;
  } catch (const std::exception& e) {
    g_gateway_ptr = nullptr;
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }
}
