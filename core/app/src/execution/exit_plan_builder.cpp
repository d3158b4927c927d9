#include "tradegate/execution/exit_plan_builder.hpp"

#include <cmath>

namespace tradegate {

using domain::AssetClass;
using domain::Direction;
using domain::Regime;
using domain::StrategyTag;
using domain::TrailRule;

namespace {

double roundTo(double v, int decimals) {
  const double f = std::pow(10.0, decimals);
  return std::round(v * f) / f;
}

double offset(Direction d, double entry, double distance, bool toward_profit) {
  const bool up = (d == Direction::Long) == toward_profit;
  return up ? entry + distance : entry - distance;
}

}  // namespace

double baseStopAtrMultiple(AssetClass a) {
  switch (a) {
    case AssetClass::Equity: return 1.5;
    case AssetClass::Crypto: return 2.0;
    case AssetClass::Futures: return 1.5;
    case AssetClass::Forex: return 1.0;
    case AssetClass::Options: return 1.5;
  }
  return 1.5;
}

double regimeStopMultiplier(Regime r) {
  switch (r) {
    case Regime::VolExpansion:
    case Regime::RiskOffStress:
      return 1.3;
    case Regime::VolContraction:
      return 0.8;
    case Regime::TrendUp:
    case Regime::TrendDown:
    case Regime::RangeNeutral:
      return 1.0;
  }
  return 1.0;
}

double strategyStopMultiplier(StrategyTag s) {
  switch (s) {
    case StrategyTag::MeanReversion: return 0.75;
    case StrategyTag::BreakoutContinuation: return 1.15;
    case StrategyTag::EventStrategy: return 1.4;
    case StrategyTag::TrendPullback:
    case StrategyTag::RangeFade:
    case StrategyTag::MomentumReversal:
      return 1.0;
  }
  return 1.0;
}

double baseTp1RewardRisk(AssetClass a) {
  switch (a) {
    case AssetClass::Equity: return 2.0;
    case AssetClass::Crypto: return 2.5;
    case AssetClass::Futures: return 2.0;
    case AssetClass::Forex: return 1.5;
    case AssetClass::Options: return 2.0;
  }
  return 2.0;
}

double baseTp2RewardRisk(AssetClass a) {
  switch (a) {
    case AssetClass::Equity: return 4.0;
    case AssetClass::Crypto: return 5.0;
    case AssetClass::Futures: return 3.5;
    case AssetClass::Forex: return 3.0;
    case AssetClass::Options: return 3.0;
  }
  return 4.0;
}

double regimeTp1Multiplier(Regime r) {
  switch (r) {
    case Regime::TrendUp:
    case Regime::TrendDown:
      return 1.2;
    case Regime::RangeNeutral:
      return 0.85;
    case Regime::VolExpansion:
    case Regime::VolContraction:
    case Regime::RiskOffStress:
      return 1.0;
  }
  return 1.0;
}

// Trend regimes trail with a chandelier, volatile ones with 2 ATR; otherwise
// the strategy decides.
TrailRule pickTrailRule(Regime regime, StrategyTag strategy) {
  if (domain::isTrendRegime(regime)) return TrailRule::Chandelier;
  if (regime == Regime::VolExpansion || regime == Regime::RiskOffStress) {
    return TrailRule::Atr2x;
  }
  switch (strategy) {
    case StrategyTag::BreakoutContinuation:
      return TrailRule::Atr1_5x;
    case StrategyTag::MeanReversion:
    case StrategyTag::RangeFade:
      return TrailRule::BreakevenAfter1R;
    case StrategyTag::TrendPullback:
    case StrategyTag::MomentumReversal:
    case StrategyTag::EventStrategy:
      return TrailRule::Atr1x;
  }
  return TrailRule::Atr1x;
}

int timeStopMinutes(AssetClass asset_class, StrategyTag strategy) {
  if (strategy == StrategyTag::EventStrategy) return 60;
  if (asset_class == AssetClass::Crypto) return 24 * 60;
  if (asset_class == AssetClass::Forex) return 8 * 60;
  if (strategy == StrategyTag::MeanReversion) return 4 * 60;
  return 390;  // US cash session
}

// ---- buildExitPlan ----
domain::ExitPlan buildExitPlan(const ExitPlanRequest& req) {
  const double stop_dist = req.atr * baseStopAtrMultiple(req.asset_class) *
                           regimeStopMultiplier(req.regime) *
                           strategyStopMultiplier(req.strategy_tag);

  const double stop = req.stop_override
                          ? *req.stop_override
                          : offset(req.direction, req.entry_price, stop_dist,
                                   false);
  const double actual_dist = std::abs(req.entry_price - stop);

  const double tp1_rr =
      baseTp1RewardRisk(req.asset_class) * regimeTp1Multiplier(req.regime);
  const double tp2_rr = baseTp2RewardRisk(req.asset_class);

  const double tp1 = req.tp1_override
                         ? *req.tp1_override
                         : offset(req.direction, req.entry_price,
                                  actual_dist * tp1_rr, true);
  const double tp2 = req.tp2_override
                         ? *req.tp2_override
                         : offset(req.direction, req.entry_price,
                                  actual_dist * tp2_rr, true);

  domain::ExitPlan plan;
  plan.stop_price = roundTo(stop, 6);
  plan.take_profit_1 = roundTo(tp1, 6);
  plan.take_profit_2 = roundTo(tp2, 6);
  plan.trail_rule = pickTrailRule(req.regime, req.strategy_tag);
  plan.time_stop_minutes = timeStopMinutes(req.asset_class, req.strategy_tag);

  // Realised R:R at each target; zero stop distance leaves them at 0 so the
  // pipeline's R:R >= 1 check rejects the plan.
  if (actual_dist > 0.0) {
    plan.rr_at_tp1 =
        roundTo(std::abs(tp1 - req.entry_price) / actual_dist, 2);
    plan.rr_at_tp2 =
        roundTo(std::abs(tp2 - req.entry_price) / actual_dist, 2);
  } else {
    plan.rr_at_tp1 = 0.0;
    plan.rr_at_tp2 = 0.0;
  }
  return plan;
}

}  // namespace tradegate
