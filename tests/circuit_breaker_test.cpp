// =============================================================================
// circuit_breaker_test.cpp
// =============================================================================
// Unit tests for CircuitBreaker on a simulated clock.
//
// Validates:
//   - CLOSED -> OPEN after the failure threshold
//   - OPEN rejects with the remaining wait, without calling through
//   - OPEN -> HALF_OPEN after the timeout, probe success closes it
//   - a failed probe reopens immediately
//   - success in CLOSED resets the failure count
//   - transition callback order
//   - only one probe runs in HALF_OPEN; concurrent callers are rejected
//   - a slow CLOSED-era call finishing mid-probe does not decide the state
// =============================================================================

#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tradegate::CircuitBreaker;
using tradegate::CircuitOpenError;
using tradegate::CircuitState;

namespace {

constexpr std::int64_t kStartMs = 1000000;

int failingCall() { throw std::runtime_error("upstream down"); }

}  // namespace

class CircuitBreakerTest : public ::testing::Test {
 protected:
  CircuitBreakerTest()
      : clock(kStartMs),
        breaker("market_data", clock,
                {3, 10000,
                 [this](const std::string& name, CircuitState from,
                        CircuitState to) {
                   transitions.push_back(name + ":" +
                                         tradegate::toString(from) + "->" +
                                         tradegate::toString(to));
                 }}) {}

  void tripOpen() {
    for (int i = 0; i < 3; ++i) {
      EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
    }
  }

  tradegate::SimulationTimeProvider clock;
  std::vector<std::string> transitions;
  CircuitBreaker breaker;
};

// -----------------------------------------------------------------------------
// 1. Threshold failures open the circuit; the error is rethrown each time.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, OpensAfterThreshold) {
  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_EQ(breaker.snapshot().failure_count, 2);

  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_EQ(breaker.state(), CircuitState::Open);

  const auto snap = breaker.snapshot();
  EXPECT_EQ(snap.name, "market_data");
  EXPECT_EQ(snap.failure_count, 3);
  EXPECT_EQ(snap.last_failure_ms, kStartMs);
  EXPECT_EQ(snap.failure_threshold, 3);
  EXPECT_EQ(snap.reset_timeout_ms, 10000);
}

// -----------------------------------------------------------------------------
// 2. While OPEN the wrapped call never runs and retry_after counts down.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, OpenRejectsWithoutCalling) {
  tripOpen();
  clock.advance_by(4000);

  int calls = 0;
  try {
    breaker.call([&]() { return ++calls; });
    FAIL() << "expected CircuitOpenError";
  } catch (const CircuitOpenError& e) {
    EXPECT_EQ(e.circuit_name(), "market_data");
    EXPECT_EQ(e.retry_after_ms(), 6000);
    EXPECT_EQ(std::string(e.what()),
              "Circuit breaker 'market_data' is OPEN, requests blocked for 6s");
  }
  EXPECT_EQ(calls, 0);
}

// -----------------------------------------------------------------------------
// 3. After the timeout a probe is admitted; success closes the circuit.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, ProbeSuccessCloses) {
  tripOpen();
  clock.advance_by(10000);

  EXPECT_EQ(breaker.call([]() { return 42; }), 42);
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_EQ(breaker.snapshot().failure_count, 0);

  const std::vector<std::string> expected = {
      "market_data:CLOSED->OPEN", "market_data:OPEN->HALF_OPEN",
      "market_data:HALF_OPEN->CLOSED"};
  EXPECT_EQ(transitions, expected);
}

// -----------------------------------------------------------------------------
// 4. A failed probe reopens and restarts the timeout.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, ProbeFailureReopens) {
  tripOpen();
  clock.advance_by(10000);

  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_EQ(breaker.state(), CircuitState::Open);
  EXPECT_EQ(breaker.snapshot().last_failure_ms, kStartMs + 10000);

  clock.advance_by(9999);
  EXPECT_THROW(breaker.call([]() { return 1; }), CircuitOpenError);
}

// -----------------------------------------------------------------------------
// 5. A success while CLOSED clears the running failure count.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, SuccessResetsCount) {
  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  breaker.call([]() {});
  EXPECT_EQ(breaker.snapshot().failure_count, 0);

  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_THROW(breaker.call(failingCall), std::runtime_error);
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_TRUE(transitions.empty());
}

// -----------------------------------------------------------------------------
// 6. While the probe is running a second caller is turned away with
//    retry_after 0 and its callable never runs.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, SingleProbeInHalfOpen) {
  tripOpen();
  clock.advance_by(10000);

  std::promise<void> probe_started;
  std::promise<void> release_probe;
  std::shared_future<void> released = release_probe.get_future().share();

  std::thread probe([&]() {
    breaker.call([&]() {
      probe_started.set_value();
      released.wait();
      return 1;
    });
  });
  probe_started.get_future().wait();
  EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);

  int calls = 0;
  try {
    breaker.call([&]() { return ++calls; });
    ADD_FAILURE() << "expected CircuitOpenError";
  } catch (const CircuitOpenError& e) {
    EXPECT_EQ(e.retry_after_ms(), 0);
  }
  EXPECT_EQ(calls, 0);

  release_probe.set_value();
  probe.join();
  EXPECT_EQ(breaker.state(), CircuitState::Closed);
  EXPECT_EQ(breaker.call([&]() { return ++calls; }), 1);
}

// -----------------------------------------------------------------------------
// 7. A call admitted while CLOSED that returns during the probe leaves the
//    decision to the probe.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, StaleCallDoesNotDecideProbe) {
  std::promise<void> slow_started;
  std::promise<void> release_slow;
  std::shared_future<void> slow_released = release_slow.get_future().share();
  std::thread slow([&]() {
    breaker.call([&]() {
      slow_started.set_value();
      slow_released.wait();
      return 7;
    });
  });
  slow_started.get_future().wait();

  tripOpen();
  clock.advance_by(10000);

  std::promise<void> probe_started;
  std::promise<void> release_probe;
  std::shared_future<void> probe_released = release_probe.get_future().share();
  std::thread probe([&]() {
    EXPECT_THROW(breaker.call([&]() -> int {
                   probe_started.set_value();
                   probe_released.wait();
                   throw std::runtime_error("still down");
                 }),
                 std::runtime_error);
  });
  probe_started.get_future().wait();

  release_slow.set_value();
  slow.join();
  EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
  EXPECT_THROW(breaker.call([]() { return 1; }), CircuitOpenError);

  release_probe.set_value();
  probe.join();
  EXPECT_EQ(breaker.state(), CircuitState::Open);
}

// -----------------------------------------------------------------------------
// 8. Named presets.
// -----------------------------------------------------------------------------
TEST(CircuitBreakerPresetTest, Presets) {
  EXPECT_EQ(tradegate::marketDataBreakerOptions().failure_threshold, 5);
  EXPECT_EQ(tradegate::marketDataBreakerOptions().reset_timeout_ms, 60000);
  EXPECT_EQ(tradegate::cryptoDataBreakerOptions().reset_timeout_ms, 45000);
  EXPECT_EQ(tradegate::aiProviderBreakerOptions().failure_threshold, 3);
  EXPECT_EQ(tradegate::aiProviderBreakerOptions().reset_timeout_ms, 30000);
}
