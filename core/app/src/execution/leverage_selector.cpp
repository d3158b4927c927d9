#include "tradegate/execution/leverage_selector.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradegate {

using domain::AssetClass;
using domain::Regime;
using domain::RiskMode;

double leverageCap(AssetClass a) {
  switch (a) {
    case AssetClass::Equity: return 4.0;
    case AssetClass::Crypto: return 20.0;
    case AssetClass::Futures: return 50.0;
    case AssetClass::Forex: return 50.0;
    case AssetClass::Options: return 1.0;
  }
  return 1.0;
}

double regimeLeverageFraction(Regime r) {
  switch (r) {
    case Regime::TrendUp:
    case Regime::TrendDown:
      return 0.75;
    case Regime::RangeNeutral: return 0.50;
    case Regime::VolContraction: return 0.60;
    case Regime::VolExpansion: return 0.35;
    case Regime::RiskOffStress: return 0.20;
  }
  return 0.50;
}

double riskModeLeverageFraction(RiskMode m) {
  switch (m) {
    case RiskMode::Normal: return 1.0;
    case RiskMode::Throttled: return 0.60;
    case RiskMode::Defensive: return 0.30;
    case RiskMode::Locked: return 0.0;
  }
  return 0.50;
}

double volatilityLeverageScalar(double atr_percent) {
  if (atr_percent >= 8.0) return 0.15;
  if (atr_percent >= 5.0) return 0.30;
  if (atr_percent >= 3.0) return 0.50;
  if (atr_percent >= 1.5) return 0.75;
  return 1.0;
}

// ---- computeLeverage ----
domain::LeverageResult computeLeverage(const LeverageRequest& req) {
  domain::LeverageResult out;
  const double cap = leverageCap(req.asset_class);
  if (cap <= 1.0) return out;

  const double raw = cap * regimeLeverageFraction(req.regime) *
                     riskModeLeverageFraction(req.risk_mode) *
                     volatilityLeverageScalar(req.atr_percent);
  const double recommended = std::max(1.0, std::round(raw * 100.0) / 100.0);

  out.max_leverage = cap;
  out.recommended_leverage = recommended;

  if (req.override_leverage && *req.override_leverage > 0.0) {
    const double ov = *req.override_leverage;
    std::ostringstream reason;
    if (ov > cap) {
      reason << "Override " << ov << "x exceeds "
             << domain::toString(req.asset_class) << " cap " << cap << "x.";
      out.recommended_leverage = cap;
      out.capped = true;
      out.cap_reason = reason.str();
    } else if (ov > recommended * 1.5) {
      reason << "Override " << ov << "x is above recommended " << recommended
             << "x, elevated risk.";
      out.recommended_leverage = ov;
      out.capped = true;
      out.cap_reason = reason.str();
    } else {
      out.recommended_leverage = ov;
    }
  }
  return out;
}

}  // namespace tradegate
