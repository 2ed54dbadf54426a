// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for ordersim::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers receive events in subscription order
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish and unsubscribe from inside a callback
//   - Payload integrity through the variant dispatch path
//
// Design note: All tests are single-threaded (testing EventBus in isolation).
// The Backtester tests cover the events a real run publishes.
// =============================================================================

#include "ordersim/eventbus/event_bus.hpp"
#include "ordersim/events/event.hpp"
#include "ordersim/events/event_types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  ordersim::EventBus bus;

  static ordersim::FillEvent makeFill(const std::string& symbol,
                                      double price) {
    ordersim::FillEvent e;
    e.fill.order_id = 7;
    e.fill.symbol = symbol;
    e.fill.side = ordersim::domain::Side::Buy;
    e.fill.price = price;
    e.fill.quantity = 1.0;
    return e;
  }

  static ordersim::BarProcessedEvent makeBar(const std::string& symbol) {
    ordersim::BarProcessedEvent e;
    e.symbol = symbol;
    e.datetime_ms = 60'000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: Loggers subscribe generically and must see every event. If the
//      variant dispatch skips a type, logs would be silently incomplete.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const ordersim::Event&) { ++call_count; });

  bus.publish(makeFill("BTCUSDT", 100.0));
  bus.publish(makeBar("BTCUSDT"));
  bus.publish(ordersim::DataErrorEvent{});
  bus.publish(ordersim::RiskViolationEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// Why: The RiskEngine subscribes to PositionUpdateEvent; if it were handed a
//      FillEvent it would read the wrong payload.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int fill_count = 0;
  bus.subscribe<ordersim::FillEvent>(
      [&fill_count](const ordersim::FillEvent&) { ++fill_count; });

  bus.publish(makeFill("BTCUSDT", 100.0));
  bus.publish(makeBar("BTCUSDT"));
  bus.publish(ordersim::PositionUpdateEvent{});

  EXPECT_EQ(fill_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the event, in subscription order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersInOrder) {
  std::vector<char> order;
  bus.subscribe<ordersim::FillEvent>(
      [&order](const ordersim::FillEvent&) { order.push_back('a'); });
  bus.subscribe<ordersim::FillEvent>(
      [&order](const ordersim::FillEvent&) { order.push_back('b'); });
  bus.subscribe([&order](const ordersim::Event&) { order.push_back('c'); });

  bus.publish(makeFill("BTCUSDT", 100.0));

  EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'c'}));
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// Why: The RiskEngine unsubscribes in its destructor. A callback firing
//      after that would touch a destroyed object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<ordersim::FillEvent>(
      [&call_count](const ordersim::FillEvent&) { ++call_count; });

  bus.publish(makeFill("BTCUSDT", 100.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeFill("BTCUSDT", 101.0));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeFill("BTCUSDT", 100.0)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Why: The RiskEngine publishes a RiskViolationEvent from inside its
//      PositionUpdateEvent callback and then receives it itself. publish()
//      copies the subscriber list and dispatches unlocked; holding the lock
//      across callbacks would hang here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int violations = 0;

  bus.subscribe<ordersim::RiskViolationEvent>(
      [&violations](const ordersim::RiskViolationEvent&) { ++violations; });

  bus.subscribe<ordersim::PositionUpdateEvent>(
      [this](const ordersim::PositionUpdateEvent& e) {
        ordersim::RiskViolationEvent violation;
        violation.symbol = e.position.symbol;
        violation.reason = "reentrant";
        bus.publish(violation);
      });

  ordersim::PositionUpdateEvent update;
  update.position.symbol = "BTCUSDT";
  bus.publish(update);

  EXPECT_EQ(violations, 1);
}

// -----------------------------------------------------------------------------
// 7. A callback may unsubscribe itself; the current event is still delivered
//    to everyone in the snapshot.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanUnsubscribeInsideCallback) {
  int first = 0;
  int second = 0;
  ordersim::EventBus::SubscriptionId self = 0;

  self = bus.subscribe<ordersim::FillEvent>(
      [this, &first, &self](const ordersim::FillEvent&) {
        ++first;
        bus.unsubscribe(self);
      });
  bus.subscribe<ordersim::FillEvent>(
      [&second](const ordersim::FillEvent&) { ++second; });

  bus.publish(makeFill("BTCUSDT", 100.0));
  bus.publish(makeFill("BTCUSDT", 100.0));

  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);
}

// -----------------------------------------------------------------------------
// 8. Field values must survive the variant round trip: publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string received_symbol;
  double received_price = 0.0;
  ordersim::domain::OrderId received_id = 0;

  bus.subscribe<ordersim::FillEvent>(
      [&](const ordersim::FillEvent& e) {
        received_symbol = e.fill.symbol;
        received_price = e.fill.price;
        received_id = e.fill.order_id;
      });

  bus.publish(makeFill("ETHUSDT", 237.50));

  EXPECT_EQ(received_symbol, "ETHUSDT");
  EXPECT_DOUBLE_EQ(received_price, 237.50);
  EXPECT_EQ(received_id, 7u);
}
