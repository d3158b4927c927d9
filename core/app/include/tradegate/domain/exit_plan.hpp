#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// ExitPlan — stop, targets and trade-management rules for one intent
// -----------------------------------------------------------------------------
//
// @details
// rr_at_tp1 / rr_at_tp2 are the reward:risk ratios realised at each target
// given the final stop (|tp - entry| / |entry - stop|), rounded to two
// decimals. Prices are rounded to six decimals.
//
// Invariant (checked by ExecutionPipeline, not here): stop and TP1 are
// finite, positive and on the correct side of entry, and rr_at_tp1 >= 1.
// time_stop_minutes == 0 means no time stop.
// -----------------------------------------------------------------------------
struct ExitPlan {
  double stop_price{0.0};
  double take_profit_1{0.0};
  std::optional<double> take_profit_2;
  TrailRule trail_rule{TrailRule::None};
  int time_stop_minutes{0};
  double rr_at_tp1{0.0};
  std::optional<double> rr_at_tp2;
};

}  // namespace domain
}  // namespace tradegate
