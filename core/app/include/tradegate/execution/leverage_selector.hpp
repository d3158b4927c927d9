#pragma once

#include "tradegate/domain/leverage_result.hpp"
#include "tradegate/domain/market_types.hpp"

#include <optional>

namespace tradegate {

struct LeverageRequest {
  domain::AssetClass asset_class{domain::AssetClass::Equity};
  domain::Regime regime{domain::Regime::RangeNeutral};
  domain::RiskMode risk_mode{domain::RiskMode::Normal};
  double atr_percent{2.0};
  std::optional<double> override_leverage;
};

// -----------------------------------------------------------------------------
// Leverage selector
// -----------------------------------------------------------------------------
//
// recommended = max(1, round2(cap * regime * risk mode * volatility))
//
//   cap:        equity 4, crypto 20, futures 50, forex 50, options 1
//   regime:     trend 0.75, range 0.50, contraction 0.60, expansion 0.35,
//               risk-off 0.20
//   risk mode:  NORMAL 1.0, THROTTLED 0.60, DEFENSIVE 0.30, LOCKED 0
//   volatility: ATR% >= 8 0.15, >= 5 0.30, >= 3 0.50, >= 1.5 0.75, else 1
//
// Options never carry leverage. A positive override is clipped to the cap
// (capped, with reason) or flagged when above 1.5x the recommendation
// (capped, elevated-risk reason, value kept).
// -----------------------------------------------------------------------------

double leverageCap(domain::AssetClass a);
double regimeLeverageFraction(domain::Regime r);
double riskModeLeverageFraction(domain::RiskMode m);
double volatilityLeverageScalar(double atr_percent);

domain::LeverageResult computeLeverage(const LeverageRequest& req);

}  // namespace tradegate
