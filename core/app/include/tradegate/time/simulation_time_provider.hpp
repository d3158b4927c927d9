#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when the owner moves it.
//
// @details
// Used by the test suite (breaker cooldowns, ATR cache expiry, session
// phases) and by any replay harness that evaluates historical intents at
// their original timestamps.
//
// Internal storage:
//   std::atomic<int64_t>, so a writer thread and any number of reader
//   threads need no further locking.
//
// Monotonicity is not enforced; tests are free to set arbitrary times.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute epoch-ms value.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradegate
