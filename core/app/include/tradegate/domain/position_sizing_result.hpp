#pragma once

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// PositionSizingResult
// -----------------------------------------------------------------------------
//
// @details
// Invariants (for any positive stop distance):
//   total_risk_usd <= account_equity * risk_pct
//   notional_usd   <= account_equity * max_notional_pct * leverage
//
// notional_usd is the market exposure (quantity * entry). leverage is the
// effective leverage the exposure is financed with; it raises the notional
// ceiling, never the dollar risk.
// -----------------------------------------------------------------------------
struct PositionSizingResult {
  double quantity{0.0};        // lot-rounded units / shares / contracts
  double raw_quantity{0.0};    // after caps, before lot rounding
  double risk_per_unit{0.0};   // |entry - stop|
  double total_risk_usd{0.0};  // quantity * risk_per_unit
  double account_equity{0.0};
  double risk_pct{0.0};
  double notional_usd{0.0};
  double leverage{1.0};
};

}  // namespace domain
}  // namespace tradegate
