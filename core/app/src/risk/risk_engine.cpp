#include "ordersim/risk/risk_engine.hpp"
#include "ordersim/portfolio/position_manager.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace ordersim {

// -----------------------------------------------------------------------------
// Constructor: subscribe to PositionUpdateEvent and RiskViolationEvent
// -----------------------------------------------------------------------------
RiskEngine::RiskEngine(EventBus& bus, const PositionManager& positions,
                       const domain::RiskLimits& limits,
                       SequenceSource next_sequence)
    : bus_(bus),
      positions_(positions),
      limits_(limits),
      next_sequence_(std::move(next_sequence)) {
  position_sub_id_ = bus_.subscribe<PositionUpdateEvent>(
      [this](const PositionUpdateEvent& e) { onPositionUpdate(e); });

  violation_sub_id_ = bus_.subscribe<RiskViolationEvent>(
      [this](const RiskViolationEvent& e) { onRiskViolation(e); });
}

RiskEngine::~RiskEngine() {
  bus_.unsubscribe(violation_sub_id_);
  bus_.unsubscribe(position_sub_id_);
}

// -----------------------------------------------------------------------------
// check: kill switch first, then the position limit
// -----------------------------------------------------------------------------
std::optional<domain::RejectReason> RiskEngine::check(
    const domain::OrderRequest& request,
    double pending_signed_quantity) const {
  if (halt_trading_) {
    std::cerr << "[RiskEngine] HALTED, rejecting order for " << request.symbol
              << "\n";
    return domain::RejectReason::TradingHalted;
  }

  const double current = positions_.position(request.symbol).quantity;
  const double proposed = current + pending_signed_quantity +
                          domain::sideSign(request.side) * request.quantity;
  if (std::abs(proposed) > limits_.max_position_per_symbol) {
    std::cerr << "[RiskEngine] Max position limit ("
              << limits_.max_position_per_symbol
              << ") would be exceeded for " << request.symbol
              << " (current=" << current
              << ", pending=" << pending_signed_quantity
              << ", proposed=" << proposed << ")\n";
    return domain::RejectReason::PositionLimitExceeded;
  }
  return std::nullopt;
}

void RiskEngine::haltTrading() {
  halt_trading_ = true;
  std::cerr << "[RiskEngine] Trading halted by operator\n";
}

bool RiskEngine::isHalted() const { return halt_trading_; }

// -----------------------------------------------------------------------------
// onPositionUpdate: drawdown check, publish the violation outside any lock
// -----------------------------------------------------------------------------
void RiskEngine::onPositionUpdate(const PositionUpdateEvent& event) {
  const domain::Position& pos = event.position;
  if (halt_trading_ || pos.realized_pnl >= limits_.max_drawdown) {
    return;
  }

  RiskViolationEvent violation;
  violation.symbol = pos.symbol;
  violation.reason = "Max Drawdown Exceeded";
  violation.current_value = pos.realized_pnl;
  violation.limit_value = limits_.max_drawdown;
  violation.timestamp = event.timestamp;
  violation.sequence_id =
      next_sequence_ ? next_sequence_() : own_sequence_++;
  bus_.publish(violation);
}

// -----------------------------------------------------------------------------
// onRiskViolation: activate the kill switch
// -----------------------------------------------------------------------------
void RiskEngine::onRiskViolation(const RiskViolationEvent& event) {
  halt_trading_ = true;
  std::cerr << "[RiskEngine] CRITICAL: " << event.reason << " for "
            << event.symbol << " (value=" << event.current_value
            << ", limit=" << event.limit_value
            << "). ALL TRADING HALTED.\n";
}

}  // namespace ordersim
