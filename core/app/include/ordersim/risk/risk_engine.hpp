#pragma once

#include "ordersim/domain/order_request.hpp"
#include "ordersim/domain/reject_reason.hpp"
#include "ordersim/domain/risk_limits.hpp"
#include "ordersim/eventbus/event_bus.hpp"
#include "ordersim/events/position_update_event.hpp"
#include "ordersim/events/risk_violation_event.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace ordersim {

class PositionManager;  // forward declaration — header-only dependency

// -----------------------------------------------------------------------------
// RiskEngine
// -----------------------------------------------------------------------------
//
// @brief  Pre-trade position limit plus a post-trade drawdown kill switch,
//         consulted by the Backtester before an order request reaches a book.
//
// @details
// Risk checks:
//
//   1. Kill switch (post-trade): RiskEngine subscribes to PositionUpdateEvent.
//      When a position's realized_pnl falls below limits.max_drawdown it
//      publishes a RiskViolationEvent. It also subscribes to
//      RiskViolationEvent, whoever publishes it, and halts on receipt. Once
//      halted every request is rejected with TradingHalted.
//
//   2. Max position (pre-trade): a request is rejected with
//      PositionLimitExceeded when
//        |position + pending + signed request quantity| > max_position
//      where pending is the signed remaining quantity of the symbol's open
//      orders on the same side as the request.
//
// check() returns a reason instead of dropping the request, so the caller
// reports the rejection like any validation failure.
//
// Thread model:
//   Callbacks run on the thread publishing on the bus, which is the thread
//   driving the owning Backtester. haltTrading() and isHalted() are safe
//   from any thread.
//
// Ownership:
//   Holds references to the EventBus and PositionManager; both are owned by
//   the Backtester and outlive this object.
// -----------------------------------------------------------------------------
class RiskEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Subscribes to PositionUpdateEvent and RiskViolationEvent.
  //
  // @param  bus        Bus of the owning Backtester.
  // @param  positions  Read-only source of current position quantities.
  // @param  limits     Thresholds (copied by value).
  // @param  next_sequence
  //                    Source of sequence_id for published violations,
  //                    normally the owner's event sequence. When empty the
  //                    engine numbers its own violations from 1.
  // -------------------------------------------------------------------------
  using SequenceSource = std::function<std::uint64_t()>;

  RiskEngine(EventBus& bus, const PositionManager& positions,
             const domain::RiskLimits& limits,
             SequenceSource next_sequence = {});

  // Unsubscribes both callbacks.
  ~RiskEngine();

  RiskEngine(const RiskEngine&) = delete;
  RiskEngine& operator=(const RiskEngine&) = delete;
  RiskEngine(RiskEngine&&) = delete;
  RiskEngine& operator=(RiskEngine&&) = delete;

  // -------------------------------------------------------------------------
  // check(request, pending_signed_quantity)
  // -------------------------------------------------------------------------
  // @brief  Pre-trade check for one request.
  //
  // @return std::nullopt if the request may proceed, otherwise
  //         TradingHalted or PositionLimitExceeded.
  // -------------------------------------------------------------------------
  std::optional<domain::RejectReason> check(
      const domain::OrderRequest& request,
      double pending_signed_quantity) const;

  // Activates the kill switch manually. Cannot be undone.
  void haltTrading();

  bool isHalted() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  void onPositionUpdate(const PositionUpdateEvent& event);
  void onRiskViolation(const RiskViolationEvent& event);

  EventBus& bus_;
  const PositionManager& positions_;
  const domain::RiskLimits limits_;
  SequenceSource next_sequence_;
  std::uint64_t own_sequence_{1};
  std::atomic<bool> halt_trading_{false};
  EventBus::SubscriptionId position_sub_id_{0};
  EventBus::SubscriptionId violation_sub_id_{0};
};

}  // namespace ordersim
