#pragma once

#include "tradegate/time/i_time_provider.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider backed by std::chrono::system_clock.
//
// @details
// The host process creates one instance and hands it to DecisionEngine,
// which passes it on to its breakers, ATR cache and proposal builder.
//
// Thread model: stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradegate
