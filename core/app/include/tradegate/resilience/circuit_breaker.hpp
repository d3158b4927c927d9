#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tradegate {

enum class CircuitState {
  Closed,
  Open,
  HalfOpen,
};

const char* toString(CircuitState s);

struct CircuitBreakerOptions {
  int failure_threshold{5};
  std::int64_t reset_timeout_ms{60000};
  // Invoked after every transition, outside the breaker's lock.
  std::function<void(const std::string& name, CircuitState from,
                     CircuitState to)>
      on_state_change;
};

// Defaults per kind of dependency.
inline CircuitBreakerOptions marketDataBreakerOptions() { return {5, 60000, {}}; }
inline CircuitBreakerOptions cryptoDataBreakerOptions() { return {5, 45000, {}}; }
inline CircuitBreakerOptions aiProviderBreakerOptions() { return {3, 30000, {}}; }

// Thrown instead of invoking the wrapped call while the breaker rejects.
class CircuitOpenError : public std::runtime_error {
 public:
  CircuitOpenError(std::string name, std::int64_t retry_after_ms);

  const std::string& circuit_name() const { return name_; }
  std::int64_t retry_after_ms() const { return retry_after_ms_; }

 private:
  std::string name_;
  std::int64_t retry_after_ms_;
};

struct CircuitSnapshot {
  std::string name;
  CircuitState state{CircuitState::Closed};
  int failure_count{0};
  std::int64_t last_failure_ms{0};
  int failure_threshold{0};
  std::int64_t reset_timeout_ms{0};
};

// -----------------------------------------------------------------------------
// CircuitBreaker — three-state guard around one external dependency
// -----------------------------------------------------------------------------
//
// @brief  Rejects calls to a failing dependency until a cooldown has passed,
//         then lets a single probe decide whether to close again.
//
// @details
// State machine:
//
//   CLOSED    --(failure_threshold consecutive failures)-->  OPEN
//   OPEN      --(reset_timeout_ms since last failure)----->  HALF_OPEN
//   HALF_OPEN --(probe succeeds)--------------------------->  CLOSED
//   HALF_OPEN --(probe fails)------------------------------>  OPEN
//
// While OPEN, call() throws CircuitOpenError carrying the remaining cooldown
// and never invokes the callable. The first call after the cooldown becomes
// the probe; every other call that arrives while the probe is in flight is
// rejected with retry_after_ms == 0.
//
// Any exception thrown by the callable counts as a failure and is rethrown
// unchanged. A success resets the failure counter. Only the probe's outcome
// moves the breaker out of HALF_OPEN: a call admitted while CLOSED that
// finishes after the breaker has tripped is ignored.
//
// Thread model:
//   State is guarded by mutex_. The callable runs without the lock held, so
//   slow dependencies never serialize unrelated callers. The
//   OPEN -> HALF_OPEN transition and the probe reservation happen in the
//   same critical section, which is what limits HALF_OPEN to one probe.
//
// Ownership:
//   Created once per dependency at process start (DecisionEngine owns them)
//   and shared by reference with the adapters that call through it. Time is
//   read from the injected ITimeProvider, which must outlive the breaker.
//
// Logging:
//   Every transition is written to std::cerr as
//   "[CircuitBreaker] <name>: CLOSED -> OPEN".
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  CircuitBreaker(std::string name, const ITimeProvider& clock,
                 CircuitBreakerOptions options = {});

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;
  CircuitBreaker(CircuitBreaker&&) = delete;
  CircuitBreaker& operator=(CircuitBreaker&&) = delete;

  // Runs fn() through the breaker and returns its result.
  template <typename F>
  auto call(F&& fn) -> decltype(fn()) {
    const Admission admission = acquire();
    try {
      if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        record_success(admission);
      } else {
        auto result = fn();
        record_success(admission);
        return result;
      }
    } catch (...) {
      record_failure(admission);
      throw;
    }
  }

  CircuitState state() const;
  CircuitSnapshot snapshot() const;
  const std::string& name() const { return name_; }

 private:
  struct Transition {
    CircuitState from;
    CircuitState to;
  };

  // How a call got in: as an ordinary CLOSED call or as the HALF_OPEN probe.
  enum class Admission { Closed, Probe };

  // Throws CircuitOpenError when the call must be rejected.
  Admission acquire();
  void record_success(Admission admission);
  void record_failure(Admission admission);

  // Caller holds mutex_.
  void transition_locked(CircuitState to, std::vector<Transition>& fired);
  void notify(const std::vector<Transition>& fired) const;

  const std::string name_;
  const ITimeProvider& clock_;
  const CircuitBreakerOptions options_;

  mutable std::mutex mutex_;
  CircuitState state_{CircuitState::Closed};
  int failure_count_{0};
  std::int64_t last_failure_ms_{0};
  bool probe_in_flight_{false};
};

}  // namespace tradegate
