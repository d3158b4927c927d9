// =============================================================================
// confluence_scorer_test.cpp
// =============================================================================
// Unit tests for the regime-weighted confluence scorer.
//
// Validates:
//   - weighted sum and bias labelling for a clean trend-expansion setup
//   - a failing gate caps the score at 55 regardless of the raw sum
//   - clamping of out-of-range and non-finite components
//   - regime label mapping (exact names and free-text fallbacks)
//   - component estimation from raw indicators
// =============================================================================

#include "tradegate/scoring/confluence_scorer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using tradegate::ConfluenceComponents;
using tradegate::ScoringRegime;
using tradegate::TradeBias;

namespace {

ConfluenceComponents makeComponents(double sq, double ta, double va, double ll,
                                    double mtf, double fd) {
  ConfluenceComponents c;
  c.signal_quality = sq;
  c.technical_alignment = ta;
  c.volume_activity = va;
  c.liquidity_level = ll;
  c.mtf_agreement = mtf;
  c.fundamental_derivatives = fd;
  return c;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Clean trend setup: all gates pass, score is the plain weighted sum.
//    70*.20 + 60*.25 + 55*.15 + 50*.10 + 45*.20 + 40*.10 = 55.25
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, TrendExpansionWeightedSum) {
  const auto r = tradegate::scoreConfluence(makeComponents(70, 60, 55, 50, 45, 40),
                                            ScoringRegime::TrendExpansion);

  EXPECT_FALSE(r.gated);
  EXPECT_TRUE(r.gate_violations.empty());
  EXPECT_NEAR(r.raw_score, 55.25, 1e-9);
  EXPECT_NEAR(r.weighted_score, 55.25, 1e-9);
  EXPECT_EQ(r.bias, TradeBias::Conditional);
  EXPECT_NEAR(r.breakdown[static_cast<std::size_t>(tradegate::Component::TA)],
              15.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A single gate violation caps a strong raw score at 55.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, GateViolationCapsScore) {
  const auto r = tradegate::scoreConfluence(
      makeComponents(100, 100, 100, 100, 30, 100),
      ScoringRegime::TrendExpansion);

  EXPECT_TRUE(r.gated);
  ASSERT_EQ(r.gate_violations.size(), 1u);
  EXPECT_EQ(r.gate_violations[0], "MTF=30 < gate 40");
  EXPECT_NEAR(r.raw_score, 86.0, 1e-9);
  EXPECT_DOUBLE_EQ(r.weighted_score, tradegate::kGatedScoreCap);
  EXPECT_EQ(r.bias, TradeBias::Conditional);
}

// -----------------------------------------------------------------------------
// 3. Both gates of a regime are reported, in table order.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, ReportsEveryFailingGate) {
  const auto r = tradegate::scoreConfluence(makeComponents(40, 50, 50, 50, 20, 50),
                                            ScoringRegime::Transition);
  ASSERT_EQ(r.gate_violations.size(), 2u);
  EXPECT_EQ(r.gate_violations[0].rfind("MTF=", 0), 0u);
  EXPECT_EQ(r.gate_violations[1].rfind("SQ=", 0), 0u);
  EXPECT_LE(r.weighted_score, 55.0);
}

// -----------------------------------------------------------------------------
// 4. Inputs are clamped; NaN scores as a neutral 50.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, ClampsComponents) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto r = tradegate::scoreConfluence(
      makeComponents(150, -20, nan, 100, 100, 100),
      ScoringRegime::VolExpansion);

  EXPECT_DOUBLE_EQ(r.components[0], 100.0);
  EXPECT_DOUBLE_EQ(r.components[1], 0.0);
  EXPECT_DOUBLE_EQ(r.components[2], 50.0);
  EXPECT_GE(r.weighted_score, 0.0);
  EXPECT_LE(r.weighted_score, 100.0);
}

// -----------------------------------------------------------------------------
// 5. Bias thresholds.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, BiasStepFunction) {
  EXPECT_EQ(tradegate::tradeBiasFor(54.99), TradeBias::Neutral);
  EXPECT_EQ(tradegate::tradeBiasFor(55.0), TradeBias::Conditional);
  EXPECT_EQ(tradegate::tradeBiasFor(70.0), TradeBias::Valid);
  EXPECT_EQ(tradegate::tradeBiasFor(85.0), TradeBias::HighConfluence);
}

// -----------------------------------------------------------------------------
// 6. Regime labels: engine names, scoring names and free text.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, MapsRegimeLabels) {
  EXPECT_EQ(tradegate::mapToScoringRegime("TREND_UP"),
            ScoringRegime::TrendExpansion);
  EXPECT_EQ(tradegate::mapToScoringRegime("RANGE_NEUTRAL"),
            ScoringRegime::RangeCompression);
  EXPECT_EQ(tradegate::mapToScoringRegime("risk_off_stress"),
            ScoringRegime::VolExpansion);
  EXPECT_EQ(tradegate::mapToScoringRegime("TREND_MATURE"),
            ScoringRegime::TrendMature);
  EXPECT_EQ(tradegate::mapToScoringRegime("late trend, mature"),
            ScoringRegime::TrendMature);
  EXPECT_EQ(tradegate::mapToScoringRegime("choppy"),
            ScoringRegime::RangeCompression);
  EXPECT_EQ(tradegate::mapToScoringRegime("something else"),
            ScoringRegime::Transition);
}

// -----------------------------------------------------------------------------
// 7. Estimated components stay inside 0-100 and default to neutral-ish values.
// -----------------------------------------------------------------------------
TEST(ConfluenceScorerTest, EstimatedComponentsInRange) {
  tradegate::IndicatorContext ctx;
  ctx.scanner_score = 80.0;
  ctx.rsi = 62.0;
  ctx.adx = 32.0;
  ctx.volume_ratio = 1.8;
  ctx.mtf_alignment = 4;

  const auto c = tradegate::estimateComponents(ctx);
  EXPECT_DOUBLE_EQ(c.signal_quality, 80.0);
  EXPECT_DOUBLE_EQ(c.technical_alignment, 75.0);
  EXPECT_DOUBLE_EQ(c.volume_activity, 70.0);
  EXPECT_DOUBLE_EQ(c.mtf_agreement, 80.0);
  for (double v : c.asVector()) {
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 100.0);
  }

  const auto empty = tradegate::estimateComponents({});
  for (double v : empty.asVector()) {
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 100.0);
  }
}
