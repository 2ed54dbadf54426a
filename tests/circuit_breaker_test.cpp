// =============================================================================
// circuit_breaker_test.cpp
// =============================================================================
// Unit tests for ordersim::CircuitBreaker.
//
// Validates:
//   - Closed -> Open after failure_threshold consecutive failures
//   - A success in Closed resets the failure count
//   - Open refuses calls until open_timeout_ms has elapsed, then half-opens
//   - HalfOpen closes after success_threshold successes, reopens on failure
//   - reset() returns to Closed from any state
//
// Design note: Time is driven by a SimulationTimeProvider, so the cool-down
// is stepped by hand and no test sleeps.
// =============================================================================

#include "ordersim/resilience/circuit_breaker.hpp"
#include "ordersim/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using ordersim::CircuitBreaker;
using ordersim::CircuitBreakerConfig;
using ordersim::CircuitState;

class CircuitBreakerTest : public ::testing::Test {
 protected:
  CircuitBreakerTest() : breaker(clock, CircuitBreakerConfig{3, 2, 1000}) {}

  void tripOpen() {
    for (int i = 0; i < 3; ++i) {
      breaker.recordFailure();
    }
  }

  ordersim::SimulationTimeProvider clock{10'000};
  CircuitBreaker breaker;
};

// -----------------------------------------------------------------------------
// 1. A fresh breaker is Closed and lets calls through.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, StartsClosed) {
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_TRUE(breaker.allowRequest());
  EXPECT_EQ(breaker.failureCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. The threshold-th consecutive failure opens the breaker.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, OpensAfterConsecutiveFailures) {
  breaker.recordFailure();
  breaker.recordFailure();
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_EQ(breaker.failureCount(), 2u);

  breaker.recordFailure();
  EXPECT_EQ(breaker.state(), CircuitState::Open);
  EXPECT_FALSE(breaker.allowRequest());
}

// -----------------------------------------------------------------------------
// 3. Failures must be consecutive.
// Why: A feed that drops one message in a hundred is healthy; only an
//      unbroken run of failures should take it out of service.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, SuccessResetsFailureCount) {
  breaker.recordFailure();
  breaker.recordFailure();
  breaker.recordSuccess();
  EXPECT_EQ(breaker.failureCount(), 0u);

  breaker.recordFailure();
  breaker.recordFailure();
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

// -----------------------------------------------------------------------------
// 4. Open -> HalfOpen exactly when the cool-down has elapsed.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, HalfOpensAfterTimeout) {
  tripOpen();

  clock.advance_by(999);
  EXPECT_FALSE(breaker.allowRequest());
  EXPECT_EQ(breaker.state(), CircuitState::Open);

  clock.advance_by(1);
  EXPECT_TRUE(breaker.allowRequest());
  EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
}

// -----------------------------------------------------------------------------
// 5. HalfOpen needs success_threshold successes to close.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, HalfOpenClosesAfterSuccesses) {
  tripOpen();
  clock.advance_by(1000);
  ASSERT_TRUE(breaker.allowRequest());

  breaker.recordSuccess();
  EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
  breaker.recordSuccess();
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_EQ(breaker.failureCount(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Any failure while probing reopens, with a fresh cool-down.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
  tripOpen();
  clock.advance_by(1000);
  ASSERT_TRUE(breaker.allowRequest());

  breaker.recordSuccess();
  breaker.recordFailure();
  EXPECT_EQ(breaker.state(), CircuitState::Open);

  clock.advance_by(500);
  EXPECT_FALSE(breaker.allowRequest());
  clock.advance_by(500);
  EXPECT_TRUE(breaker.allowRequest());
}

TEST_F(CircuitBreakerTest, ResetCloses) {
  tripOpen();
  breaker.reset();

  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_TRUE(breaker.allowRequest());
  EXPECT_EQ(breaker.failureCount(), 0u);
}

TEST(CircuitStateTest, Names) {
  EXPECT_STREQ(ordersim::toString(CircuitState::Closed), "Closed");
  EXPECT_STREQ(ordersim::toString(CircuitState::Open), "Open");
  EXPECT_STREQ(ordersim::toString(CircuitState::HalfOpen), "HalfOpen");
}
