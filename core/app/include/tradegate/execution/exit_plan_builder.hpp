#pragma once

#include "tradegate/domain/exit_plan.hpp"
#include "tradegate/domain/market_types.hpp"

#include <optional>

namespace tradegate {

// -----------------------------------------------------------------------------
// Exit plan builder
// -----------------------------------------------------------------------------
//
// @brief  Derives stop, targets, trail rule and time stop for an intent.
//
// @details
//   stop distance = ATR * base(asset class) * regime(stop) * strategy
//
//   base:     equity 1.5, crypto 2.0, futures 1.5, forex 1.0, options 1.5
//   regime:   VOL_EXPANSION / RISK_OFF_STRESS 1.3, VOL_CONTRACTION 0.8
//   strategy: MEAN_REVERSION 0.75, BREAKOUT_CONTINUATION 1.15,
//             EVENT_STRATEGY 1.4
//
//   TP1 = entry +/- actual stop distance * tp1 R:R(asset class) * regime(tp)
//   TP2 = entry +/- actual stop distance * tp2 R:R(asset class)
//
//   tp1 R:R: equity 2.0, crypto 2.5, futures 2.0, forex 1.5, options 2.0
//   tp2 R:R: equity 4.0, crypto 5.0, futures 3.5, forex 3.0, options 3.0
//   regime(tp): TREND_UP / TREND_DOWN 1.2, RANGE_NEUTRAL 0.85
//
// "actual" stop distance is measured from the overridden stop when one is
// given. Every value is a switch over a closed enum so a new regime,
// strategy or asset class fails to compile with -Wswitch until it is mapped.
//
// Pure; no validation. The pipeline rejects non-finite or inverted plans.
// -----------------------------------------------------------------------------

struct ExitPlanRequest {
  domain::Direction direction{domain::Direction::Long};
  double entry_price{0.0};
  double atr{0.0};
  domain::AssetClass asset_class{domain::AssetClass::Equity};
  domain::Regime regime{domain::Regime::RangeNeutral};
  domain::StrategyTag strategy_tag{domain::StrategyTag::TrendPullback};
  std::optional<double> stop_override;
  std::optional<double> tp1_override;
  std::optional<double> tp2_override;
};

double baseStopAtrMultiple(domain::AssetClass a);
double regimeStopMultiplier(domain::Regime r);
double strategyStopMultiplier(domain::StrategyTag s);
double baseTp1RewardRisk(domain::AssetClass a);
double baseTp2RewardRisk(domain::AssetClass a);
double regimeTp1Multiplier(domain::Regime r);

domain::TrailRule pickTrailRule(domain::Regime regime,
                                domain::StrategyTag strategy);

int timeStopMinutes(domain::AssetClass asset_class,
                    domain::StrategyTag strategy);

domain::ExitPlan buildExitPlan(const ExitPlanRequest& req);

}  // namespace tradegate
