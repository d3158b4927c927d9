#pragma once

#include "tradegate/domain/market_types.hpp"
#include "tradegate/domain/options_selection.hpp"

#include <optional>

namespace tradegate {

struct OptionsRequest {
  domain::Regime regime{domain::Regime::RangeNeutral};
  domain::Direction direction{domain::Direction::Long};
  double confidence{50.0};
  double entry_price{0.0};
  double risk_budget_usd{0.0};
  std::optional<domain::OptionsStructure> force_structure;
  std::optional<int> force_dte;
  std::optional<double> force_delta;
};

// -----------------------------------------------------------------------------
// Options selector
// -----------------------------------------------------------------------------
//
// @brief  Rule-based structure, DTE and delta choice with a rough premium
//         and max-loss estimate. No chain data and no pricing model.
//
// @details
// Structure:
//   VOL_EXPANSION / RISK_OFF_STRESS   call / put debit spread
//   RANGE_NEUTRAL and confidence < 65 iron condor
//   VOL_CONTRACTION and confidence>=70 straddle
//   otherwise                         long call / long put
//
// DTE by regime: trend 30, range 14, expansion 21, contraction 45,
// risk-off 7. Delta by confidence: >= 80 0.70, >= 65 0.55, >= 50 0.45,
// else 0.30.
//
// premium ~= entry * delta * sqrt(dte / 365) * iv proxy (0.45 in expansion
// or risk-off, 0.25 otherwise), per share. Max loss is one contract's
// premium (two legs for straddles and strangles), never above the risk
// budget. Strike is at the money.
// -----------------------------------------------------------------------------

domain::OptionsStructure pickOptionsStructure(domain::Regime regime,
                                              domain::Direction direction,
                                              double confidence);

int defaultDte(domain::Regime regime);
double baseDelta(double confidence);

domain::OptionsSelection selectOptions(const OptionsRequest& req);

}  // namespace tradegate
