#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every time-dependent component: the circuit
//         breaker cooldown, the ATR cache TTL, session-phase detection and
//         proposal timestamps.
//
// @details
//   - LiveTimeProvider       reads std::chrono::system_clock.
//   - SimulationTimeProvider returns whatever the test or replay harness set.
//
// Components take `const ITimeProvider&` and never read the system clock
// directly, so a breaker cooldown or a cache expiry can be exercised in a
// test by moving the simulated clock forward instead of sleeping.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently. Implementations that can be
//   written to synchronize internally.
//
// Ownership:
//   Components borrow the provider; it must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Milliseconds since the Unix epoch (UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradegate
