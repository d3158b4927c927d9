#pragma once

#include "tradegate/domain/execution_limits.hpp"
#include "tradegate/domain/exit_plan.hpp"
#include "tradegate/domain/governor_decision.hpp"
#include "tradegate/domain/trade_intent.hpp"
#include "tradegate/risk/permission_matrix.hpp"

#include <optional>

namespace tradegate {

// Current account exposure, supplied by the caller per evaluation. All
// percentages are fractions of equity.
struct ExposureState {
  std::optional<PermissionSnapshot> snapshot;
  double daily_loss_pct{0.0};
  double portfolio_heat_pct{0.0};
  int open_trade_count{0};
};

// -----------------------------------------------------------------------------
// ExecutionGovernor — execution-layer hard limits on top of the matrix
// -----------------------------------------------------------------------------
//
// @brief  Evaluates the permission matrix for an intent and then applies the
//         five execution hard limits.
//
// @details
// allowed starts as (permission != BLOCK). Each execution check that fails
// sets allowed = false and appends its code and remediation, even when the
// matrix already approved:
//
//   EXEC_DAILY_LOSS_CAP     daily loss    >= max_daily_loss_pct
//   EXEC_PORTFOLIO_HEAT     open risk     >= max_portfolio_heat_pct
//   EXEC_MAX_OPEN_TRADES    open trades   >= max_open_trades
//   EXEC_MIN_RR             rr_at_tp1     <  min_required_rr
//   EXEC_SINGLE_TRADE_RISK  risk per trade > max_single_trade_risk_pct
//
// The risk per trade checked is the intent's override when present,
// otherwise the matrix's risk_per_trade.
//
// When the exposure carries no snapshot, one is built from the intent's
// regime, event severity and market with all other session inputs at their
// defaults.
//
// Thread model:
//   const and reentrant. Holds its limits by value and the matrix by
//   reference.
// -----------------------------------------------------------------------------
class ExecutionGovernor {
 public:
  ExecutionGovernor(domain::ExecutionLimits limits,
                    const PermissionMatrix& matrix);

  ExecutionGovernor(const ExecutionGovernor&) = delete;
  ExecutionGovernor& operator=(const ExecutionGovernor&) = delete;

  domain::GovernorDecision evaluate(const domain::TradeIntent& intent,
                                    const domain::ExitPlan& exits,
                                    const ExposureState& exposure) const;

  const domain::ExecutionLimits& limits() const { return limits_; }

 private:
  domain::ExecutionLimits limits_;
  const PermissionMatrix& matrix_;
};

// TradeIntent + final stop -> matrix candidate.
CandidateIntent toCandidate(const domain::TradeIntent& intent,
                            double stop_price);

// Snapshot used when the caller supplies none.
PermissionSnapshot defaultSnapshotFor(const domain::TradeIntent& intent);

}  // namespace tradegate
