#include "ordersim/resilience/circuit_breaker.hpp"

#include <iostream>

namespace ordersim {

const char* toString(CircuitState state) {
  switch (state) {
    case CircuitState::Closed:   return "Closed";
    case CircuitState::Open:     return "Open";
    case CircuitState::HalfOpen: return "HalfOpen";
  }
  return "Unknown";
}

CircuitBreaker::CircuitBreaker(const ITimeProvider& clock,
                               CircuitBreakerConfig config)
    : clock_(clock), config_(config) {}

bool CircuitBreaker::allowRequest() {
  std::lock_guard lock(mutex_);
  switch (state_) {
    case CircuitState::Closed:
    case CircuitState::HalfOpen:
      return true;
    case CircuitState::Open:
      if (clock_.now_ms() - opened_at_ms_ >= config_.open_timeout_ms) {
        std::cout << "[CircuitBreaker] Cool-down elapsed, half-opening\n";
        state_ = CircuitState::HalfOpen;
        failure_count_ = 0;
        success_count_ = 0;
        return true;
      }
      return false;
  }
  return false;
}

void CircuitBreaker::recordSuccess() {
  std::lock_guard lock(mutex_);
  switch (state_) {
    case CircuitState::Closed:
      failure_count_ = 0;
      break;
    case CircuitState::HalfOpen:
      if (++success_count_ >= config_.success_threshold) {
        std::cout << "[CircuitBreaker] Closed after successful recovery\n";
        state_ = CircuitState::Closed;
        failure_count_ = 0;
        success_count_ = 0;
      }
      break;
    case CircuitState::Open:
      break;
  }
}

void CircuitBreaker::recordFailure() {
  std::lock_guard lock(mutex_);
  switch (state_) {
    case CircuitState::Closed:
      if (++failure_count_ >= config_.failure_threshold) {
        std::cerr << "[CircuitBreaker] Opened after " << failure_count_
                  << " consecutive failures\n";
        state_ = CircuitState::Open;
        opened_at_ms_ = clock_.now_ms();
      }
      break;
    case CircuitState::HalfOpen:
      std::cerr << "[CircuitBreaker] Probe failed, re-opening\n";
      state_ = CircuitState::Open;
      opened_at_ms_ = clock_.now_ms();
      failure_count_ = 0;
      success_count_ = 0;
      break;
    case CircuitState::Open:
      opened_at_ms_ = clock_.now_ms();
      break;
  }
}

void CircuitBreaker::reset() {
  std::lock_guard lock(mutex_);
  state_ = CircuitState::Closed;
  failure_count_ = 0;
  success_count_ = 0;
  opened_at_ms_ = 0;
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::uint32_t CircuitBreaker::failureCount() const {
  std::lock_guard lock(mutex_);
  return failure_count_;
}

}  // namespace ordersim
