// =============================================================================
// exit_plan_builder_test.cpp
// =============================================================================
// Unit tests for the ATR-based exit plan builder.
//
// Validates:
//   - stop / targets / R:R for the reference equity pullback
//   - regime target multiplier and trail rule selection
//   - short-side mirroring and crypto multipliers
//   - explicit stop override drives the target distance
//   - strategy / regime stop multipliers and time stops
//   - zero stop distance leaves R:R at 0
// =============================================================================

#include "tradegate/execution/exit_plan_builder.hpp"

#include <gtest/gtest.h>

using tradegate::ExitPlanRequest;
using tradegate::domain::AssetClass;
using tradegate::domain::Direction;
using tradegate::domain::Regime;
using tradegate::domain::StrategyTag;
using tradegate::domain::TrailRule;

namespace {

ExitPlanRequest equityLong(Regime regime) {
  ExitPlanRequest req;
  req.direction = Direction::Long;
  req.entry_price = 100.0;
  req.atr = 2.0;
  req.asset_class = AssetClass::Equity;
  req.regime = regime;
  req.strategy_tag = StrategyTag::TrendPullback;
  return req;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Range regime: 1.5 ATR stop, TP1 at 2.0 * 0.85 R.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, RangeEquityLong) {
  const auto plan = tradegate::buildExitPlan(equityLong(Regime::RangeNeutral));

  EXPECT_NEAR(plan.stop_price, 97.0, 1e-9);
  EXPECT_NEAR(plan.take_profit_1, 105.1, 1e-9);
  ASSERT_TRUE(plan.take_profit_2.has_value());
  EXPECT_NEAR(*plan.take_profit_2, 112.0, 1e-9);
  EXPECT_DOUBLE_EQ(plan.rr_at_tp1, 1.7);
  ASSERT_TRUE(plan.rr_at_tp2.has_value());
  EXPECT_DOUBLE_EQ(*plan.rr_at_tp2, 4.0);
  EXPECT_EQ(plan.trail_rule, TrailRule::Atr1x);
  EXPECT_EQ(plan.time_stop_minutes, 390);
}

// -----------------------------------------------------------------------------
// 2. Trend regime stretches TP1 to 2.4 R and trails with a chandelier.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, TrendUpExtendsTarget) {
  const auto plan = tradegate::buildExitPlan(equityLong(Regime::TrendUp));

  EXPECT_NEAR(plan.stop_price, 97.0, 1e-9);
  EXPECT_NEAR(plan.take_profit_1, 107.2, 1e-9);
  EXPECT_DOUBLE_EQ(plan.rr_at_tp1, 2.4);
  EXPECT_EQ(plan.trail_rule, TrailRule::Chandelier);
}

// -----------------------------------------------------------------------------
// 3. Crypto short: 2 ATR stop above entry, targets below, day-long time stop.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, CryptoShortMirrors) {
  ExitPlanRequest req = equityLong(Regime::TrendDown);
  req.direction = Direction::Short;
  req.asset_class = AssetClass::Crypto;

  const auto plan = tradegate::buildExitPlan(req);
  EXPECT_NEAR(plan.stop_price, 104.0, 1e-9);
  EXPECT_NEAR(plan.take_profit_1, 88.0, 1e-9);
  EXPECT_NEAR(*plan.take_profit_2, 80.0, 1e-9);
  EXPECT_DOUBLE_EQ(plan.rr_at_tp1, 3.0);
  EXPECT_EQ(plan.time_stop_minutes, 24 * 60);
}

// -----------------------------------------------------------------------------
// 4. Targets are measured from the overridden stop.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, StopOverrideDrivesTargets) {
  ExitPlanRequest req = equityLong(Regime::RangeNeutral);
  req.stop_override = 99.0;

  const auto plan = tradegate::buildExitPlan(req);
  EXPECT_DOUBLE_EQ(plan.stop_price, 99.0);
  EXPECT_NEAR(plan.take_profit_1, 101.7, 1e-9);
  EXPECT_DOUBLE_EQ(plan.rr_at_tp1, 1.7);

  req.tp1_override = 103.0;
  EXPECT_DOUBLE_EQ(tradegate::buildExitPlan(req).rr_at_tp1, 3.0);
}

// -----------------------------------------------------------------------------
// 5. Mean reversion in a contracting regime: 1.5 * 0.8 * 0.75 ATR.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, StrategyAndRegimeMultipliers) {
  ExitPlanRequest req = equityLong(Regime::VolContraction);
  req.strategy_tag = StrategyTag::MeanReversion;

  const auto plan = tradegate::buildExitPlan(req);
  EXPECT_NEAR(plan.stop_price, 98.2, 1e-9);
  EXPECT_EQ(plan.trail_rule, TrailRule::BreakevenAfter1R);
  EXPECT_EQ(plan.time_stop_minutes, 240);

  EXPECT_EQ(tradegate::pickTrailRule(Regime::VolExpansion,
                                     StrategyTag::MeanReversion),
            TrailRule::Atr2x);
  EXPECT_EQ(tradegate::pickTrailRule(Regime::RangeNeutral,
                                     StrategyTag::BreakoutContinuation),
            TrailRule::Atr1_5x);
  EXPECT_EQ(tradegate::timeStopMinutes(AssetClass::Crypto,
                                       StrategyTag::EventStrategy),
            60);
  EXPECT_EQ(tradegate::timeStopMinutes(AssetClass::Forex,
                                       StrategyTag::TrendPullback),
            480);
}

// -----------------------------------------------------------------------------
// 6. No ATR and no override: stop sits on entry, R:R stays 0.
// -----------------------------------------------------------------------------
TEST(ExitPlanBuilderTest, ZeroDistanceLeavesRrZero) {
  ExitPlanRequest req = equityLong(Regime::TrendUp);
  req.atr = 0.0;

  const auto plan = tradegate::buildExitPlan(req);
  EXPECT_DOUBLE_EQ(plan.stop_price, 100.0);
  EXPECT_DOUBLE_EQ(plan.rr_at_tp1, 0.0);
}
