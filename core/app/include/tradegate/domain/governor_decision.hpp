#pragma once

#include "tradegate/domain/market_types.hpp"

#include <string>
#include <vector>

namespace tradegate {
namespace domain {

// Exposure constraints attached to an upstream permission verdict.
struct PermissionConstraints {
  double max_gross_exposure{1.5};
  double max_net_exposure{0.8};
  double max_open_risk_r{3.0};
  bool no_add_ons{false};
  bool trigger_only{false};
};

// -----------------------------------------------------------------------------
// PermissionVerdict — result of PermissionMatrix::evaluateCandidate()
// -----------------------------------------------------------------------------
//
// @details
// reason_codes and required_actions are parallel-ish lists: every blocking
// reason carries a remediation string; advisory codes (NO_ADD_ONS,
// POLICY_CLEAR, SIZE_REDUCED, TRIGGER_ONLY) do not.
//
// max_position_size is expressed in units against a notional 100k account:
// floor(100000 * risk_per_trade / stop_distance).
// -----------------------------------------------------------------------------
struct PermissionVerdict {
  Permission permission{Permission::Block};
  RiskMode risk_mode{RiskMode::Normal};
  double risk_per_trade{0.0};
  double max_position_size{0.0};
  double required_stop_min_distance{0.0};
  PermissionConstraints constraints;
  std::vector<std::string> required_actions;
  std::vector<std::string> reason_codes;
};

// -----------------------------------------------------------------------------
// GovernorDecision — execution-layer verdict
// -----------------------------------------------------------------------------
//
// @details
// Wraps the upstream PermissionVerdict with the execution hard limits.
// allowed is false if the upstream permission is BLOCK or any execution
// check fails. reason_codes keeps the upstream codes first, then the
// EXEC_* codes in evaluation order; required_actions follows the same order.
// -----------------------------------------------------------------------------
struct GovernorDecision {
  bool allowed{false};
  Permission permission{Permission::Block};
  RiskMode risk_mode{RiskMode::Normal};
  double risk_per_trade{0.0};
  double max_position_size{0.0};
  std::vector<std::string> reason_codes;
  std::vector<std::string> required_actions;
  PermissionVerdict raw;
};

}  // namespace domain
}  // namespace tradegate
