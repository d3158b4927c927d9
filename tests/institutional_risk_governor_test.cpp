// =============================================================================
// institutional_risk_governor_test.cpp
// =============================================================================
// Unit tests for the institutional capital / drawdown / correlation /
// volatility / behavior governor.
//
// Validates:
//   - a clean input is allowed and its IRS selects the sizing mode
//   - each hard block is reported with its category prefix
//   - hard blocks zero the final size regardless of IRS
//   - overtrading and rule-violation blocks, including their boundaries
//   - volatility classification and drawdown step function
// =============================================================================

#include "tradegate/risk/institutional_risk_governor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using tradegate::GovernorMode;
using tradegate::InstitutionalRiskInput;
using tradegate::VolatilityRegime;

namespace {

bool hasReason(const tradegate::InstitutionalRiskOutput& out,
               const std::string& reason) {
  return std::find(out.hard_block_reasons.begin(), out.hard_block_reasons.end(),
                   reason) != out.hard_block_reasons.end();
}

}  // namespace

class InstitutionalRiskGovernorTest : public ::testing::Test {
 protected:
  InstitutionalRiskGovernorTest() {
    input.symbol = "SPY";
    input.archetype = tradegate::domain::TradeArchetype::PullbackEntry;
    input.conviction = 70.0;
    input.tps = 70.0;
    input.atr_percent = 1.5;
    input.expansion_probability = 50.0;
    input.account.open_risk_pct = 0.5;
    input.account.proposed_risk_pct = 0.5;
    input.account.daily_risk_pct = 0.5;
    input.account.daily_r = 0.0;
  }

  tradegate::InstitutionalRiskGovernor governor;
  InstitutionalRiskInput input;
};

// -----------------------------------------------------------------------------
// 1. Clean input: IRS 0.845 -> NORMAL mode, 0.85 sizing multiplier.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, CleanInputNormalMode) {
  const auto out = governor.evaluate(input);

  EXPECT_TRUE(out.execution_allowed);
  EXPECT_FALSE(out.hard_blocked);
  EXPECT_TRUE(out.hard_block_reasons.empty());
  EXPECT_NEAR(out.irs, 0.845, 0.006);
  EXPECT_EQ(out.mode, GovernorMode::Normal);
  EXPECT_DOUBLE_EQ(out.capital.score, 0.55);
  EXPECT_EQ(out.volatility.regime, VolatilityRegime::Normal);
  EXPECT_EQ(out.correlation.cluster, "GENERAL");
  EXPECT_DOUBLE_EQ(out.sizing.final_size, 0.85);
}

// -----------------------------------------------------------------------------
// 2. Smaller proposed risk lifts capital score into FULL_OFFENSE.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, LowUtilizationFullOffense) {
  input.account.proposed_risk_pct = 0.2;
  const auto out = governor.evaluate(input);

  EXPECT_EQ(out.mode, GovernorMode::FullOffense);
  EXPECT_DOUBLE_EQ(out.sizing.final_size, 1.0);
  EXPECT_EQ(out.allowed.back(), "Full offense available under strong IRS");
}

// -----------------------------------------------------------------------------
// 3. Per-trade capital cap.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, CapitalBlock) {
  input.account.proposed_risk_pct = 1.5;
  const auto out = governor.evaluate(input);

  EXPECT_FALSE(out.execution_allowed);
  EXPECT_TRUE(out.capital.blocked);
  EXPECT_TRUE(hasReason(out, "CAPITAL: Per-trade risk exceeds 1%"));
  EXPECT_DOUBLE_EQ(out.sizing.final_size, 0.0);
}

// -----------------------------------------------------------------------------
// 4. -5R daily drawdown locks out even with perfect other scores.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, DrawdownLockout) {
  input.account.proposed_risk_pct = 0.2;
  input.account.daily_r = -5.0;
  const auto out = governor.evaluate(input);

  EXPECT_FALSE(out.execution_allowed);
  EXPECT_TRUE(out.drawdown.lockout);
  EXPECT_TRUE(hasReason(out, "DRAWDOWN: AUTO LOCKOUT: daily drawdown <= -5R"));
  EXPECT_DOUBLE_EQ(out.sizing.final_size, 0.0);
}

// -----------------------------------------------------------------------------
// 5. Two same-direction positions in the cluster block a third.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, CorrelationBlock) {
  input.symbol = "AAPL";
  input.exposure.open_positions.push_back(
      {"NVDA", tradegate::domain::Direction::Long, std::nullopt});
  input.exposure.open_positions.push_back(
      {"AMD", tradegate::domain::Direction::Long, std::nullopt});
  input.exposure.proposed = tradegate::CorrelationPosition{
      "AAPL", tradegate::domain::Direction::Long, std::nullopt};

  const auto out = governor.evaluate(input);
  EXPECT_EQ(out.correlation.cluster, "AI_TECH");
  EXPECT_EQ(out.correlation.correlated_count, 2);
  EXPECT_EQ(out.correlation.severity, tradegate::Severity::High);
  EXPECT_TRUE(hasReason(
      out, "CORRELATION: Max correlated exposure reached in AI_TECH"));
  ASSERT_FALSE(out.blocked.empty());
  EXPECT_EQ(out.blocked.front(), "New AI_TECH long positions");

  // The opposite direction does not count.
  input.exposure.proposed->direction = tradegate::domain::Direction::Short;
  EXPECT_EQ(governor.evaluate(input).correlation.correlated_count, 0);
}

// -----------------------------------------------------------------------------
// 6. EXTREME volatility blocks breakouts only.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, ExtremeVolatilityBlocksBreakout) {
  input.atr_percent = 4.0;
  input.archetype = tradegate::domain::TradeArchetype::BreakoutEarly;
  const auto out = governor.evaluate(input);

  EXPECT_EQ(out.volatility.regime, VolatilityRegime::Extreme);
  EXPECT_TRUE(out.volatility.breakout_blocked);
  EXPECT_TRUE(
      hasReason(out, "VOLATILITY: EXTREME regime blocks breakout entries"));

  input.archetype = tradegate::domain::TradeArchetype::PullbackEntry;
  EXPECT_FALSE(governor.evaluate(input).volatility.breakout_blocked);
}

// -----------------------------------------------------------------------------
// 7. Rapid loss cluster triggers a 30-minute cooldown.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, BehaviorCooldown) {
  input.behavior.consecutive_losses = 3;
  input.behavior.losses_window_minutes = 15.0;
  const auto out = governor.evaluate(input);

  EXPECT_TRUE(out.behavior.cooldown_active);
  EXPECT_EQ(out.behavior.cooldown_minutes, 30);
  EXPECT_TRUE(hasReason(
      out, "BEHAVIOR: COOLDOWN MODE: 30 minutes after rapid loss cluster"));
  EXPECT_FALSE(out.execution_allowed);
}

// -----------------------------------------------------------------------------
// 8. More than six trades with negative expectancy blocks; six does not.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, BehaviorOvertrading) {
  input.behavior.trades_this_session = 6;
  input.behavior.expectancy_r = -0.4;
  const auto at_limit = governor.evaluate(input);
  EXPECT_FALSE(at_limit.behavior.overtrading_blocked);
  EXPECT_TRUE(at_limit.execution_allowed);

  input.behavior.trades_this_session = 7;
  const auto out = governor.evaluate(input);
  EXPECT_TRUE(out.behavior.overtrading_blocked);
  EXPECT_TRUE(
      hasReason(out, "BEHAVIOR: Overtrading detected with negative expectancy"));
  EXPECT_TRUE(out.hard_blocked);
  EXPECT_FALSE(out.execution_allowed);
  EXPECT_DOUBLE_EQ(out.sizing.final_size, 0.0);

  input.behavior.expectancy_r = 0.2;
  EXPECT_TRUE(governor.evaluate(input).execution_allowed);
}

// -----------------------------------------------------------------------------
// 9. Two rule violations block; one only lowers the behavior score.
// -----------------------------------------------------------------------------
TEST_F(InstitutionalRiskGovernorTest, BehaviorRuleViolations) {
  input.behavior.rule_violations = 1;
  const auto one = governor.evaluate(input);
  EXPECT_FALSE(one.behavior.violations_blocked);
  EXPECT_TRUE(one.execution_allowed);
  EXPECT_NEAR(one.behavior.score, 0.92, 1e-9);

  input.behavior.rule_violations = 2;
  const auto out = governor.evaluate(input);
  EXPECT_TRUE(out.behavior.violations_blocked);
  EXPECT_TRUE(hasReason(out, "BEHAVIOR: Repeated rule violations detected"));
  EXPECT_FALSE(out.execution_allowed);
}

// -----------------------------------------------------------------------------
// 10. Volatility classification thresholds.
// -----------------------------------------------------------------------------
TEST(InstitutionalHelpersTest, ClassifyVolatility) {
  using tradegate::ExpansionAcceleration;
  EXPECT_EQ(tradegate::classifyVolatilityRegime(3.5, 0, ExpansionAcceleration::Flat),
            VolatilityRegime::Extreme);
  EXPECT_EQ(
      tradegate::classifyVolatilityRegime(1.0, 74, ExpansionAcceleration::Rising),
      VolatilityRegime::Extreme);
  EXPECT_EQ(
      tradegate::classifyVolatilityRegime(1.0, 74, ExpansionAcceleration::Flat),
      VolatilityRegime::High);
  EXPECT_EQ(tradegate::classifyVolatilityRegime(2.2, 0, ExpansionAcceleration::Flat),
            VolatilityRegime::High);
  EXPECT_EQ(
      tradegate::classifyVolatilityRegime(0.9, 40, ExpansionAcceleration::Flat),
      VolatilityRegime::Low);
  EXPECT_EQ(
      tradegate::classifyVolatilityRegime(1.5, 50, ExpansionAcceleration::Flat),
      VolatilityRegime::Normal);
}

// -----------------------------------------------------------------------------
// 11. Drawdown steps and the A+ exception at -4R.
// -----------------------------------------------------------------------------
TEST(InstitutionalHelpersTest, DrawdownProfile) {
  EXPECT_DOUBLE_EQ(tradegate::drawdownProfile(-1.0, 50, 50).size_multiplier, 1.0);
  EXPECT_DOUBLE_EQ(tradegate::drawdownProfile(-2.0, 50, 50).size_multiplier, 0.75);
  EXPECT_DOUBLE_EQ(tradegate::drawdownProfile(-3.0, 50, 50).size_multiplier, 0.5);

  const auto not_qualified = tradegate::drawdownProfile(-4.0, 80, 80);
  EXPECT_TRUE(not_qualified.lockout);
  EXPECT_TRUE(not_qualified.a_plus_only);

  const auto a_plus = tradegate::drawdownProfile(-4.0, 85, 80);
  EXPECT_FALSE(a_plus.lockout);
  EXPECT_DOUBLE_EQ(a_plus.size_multiplier, 0.35);

  EXPECT_TRUE(tradegate::drawdownProfile(-6.0, 99, 99).lockout);
}

// -----------------------------------------------------------------------------
// 12. IRS mode bands.
// -----------------------------------------------------------------------------
TEST(InstitutionalHelpersTest, ModeFromIrs) {
  EXPECT_EQ(tradegate::governorModeFromIrs(0.85), GovernorMode::FullOffense);
  EXPECT_EQ(tradegate::governorModeFromIrs(0.70), GovernorMode::Normal);
  EXPECT_EQ(tradegate::governorModeFromIrs(0.50), GovernorMode::Defensive);
  EXPECT_EQ(tradegate::governorModeFromIrs(0.49), GovernorMode::Lockdown);
  EXPECT_DOUBLE_EQ(tradegate::governorModeMultiplier(GovernorMode::Lockdown), 0.0);
}
