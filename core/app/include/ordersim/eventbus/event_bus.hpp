#pragma once

#include "ordersim/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish/subscribe channel owned by a Backtester.
// The backtester publishes order, fill, position, data-error and risk events;
// observers subscribe either to everything or to one Event alternative.
//
// The bus is an outbound notification path only. Simulation results never
// depend on who is subscribed, so a run with no observers produces the same
// fills as a run with a logger attached.
//
// Thread model: subscribe, unsubscribe and publish may be called from any
// thread. Callbacks run on the publishing thread before publish() returns.
// A callback may publish or unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback for every published event.
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only sees events holding EventType, e.g.
  //   bus.subscribe<FillEvent>([](const FillEvent& e) { ... });
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // progress on another thread may still deliver its current event.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every current subscriber, in subscription order.
  // The subscriber list is copied under the lock and callbacks run unlocked.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: filter on the variant alternative with std::get_if
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace ordersim
