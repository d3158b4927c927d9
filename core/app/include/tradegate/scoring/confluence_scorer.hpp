#pragma once

#include "tradegate/domain/market_types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Confluence scoring — regime-calibrated weighted score with hard gates
// -----------------------------------------------------------------------------
//
// @brief  Maps six 0-100 component scores through a regime-specific weight
//         vector into one weighted score, enforces the regime's minimum
//         gates, and labels the resulting trade bias.
//
// @details
// Components (index order is used by every table below):
//   SQ  signal quality
//   TA  technical alignment
//   VA  volume / activity
//   LL  liquidity level
//   MTF multi-timeframe agreement
//   FD  fundamental / derivatives context
//
// Scoring:
//   breakdown[i]   = clamp(component[i]) * weight[i]
//   raw_score      = sum(breakdown)
//   weighted_score = gated ? min(raw_score, 55) : clamp(raw_score, 0, 100)
//
// Bias is a step function of weighted_score:
//   < 55 NEUTRAL, < 70 CONDITIONAL, < 85 VALID, otherwise HIGH_CONFLUENCE.
//
// All functions here are pure and safe to call concurrently. Nothing logs.
// -----------------------------------------------------------------------------

enum class ScoringRegime {
  TrendExpansion,
  TrendMature,
  RangeCompression,
  VolExpansion,
  Transition,
};

enum class TradeBias {
  Neutral,
  Conditional,
  Valid,
  HighConfluence,
};

enum class Component : std::size_t {
  SQ = 0,
  TA = 1,
  VA = 2,
  LL = 3,
  MTF = 4,
  FD = 5,
};

inline constexpr std::size_t kComponentCount = 6;
inline constexpr double kGatedScoreCap = 55.0;

using ComponentVector = std::array<double, kComponentCount>;

// Six named 0-100 scores. Non-finite values are treated as missing and
// score a neutral 50; everything else is clamped to [0, 100] before use.
struct ConfluenceComponents {
  double signal_quality{50.0};
  double technical_alignment{50.0};
  double volume_activity{50.0};
  double liquidity_level{50.0};
  double mtf_agreement{50.0};
  double fundamental_derivatives{50.0};

  ComponentVector asVector() const {
    return {signal_quality,  technical_alignment, volume_activity,
            liquidity_level, mtf_agreement,       fundamental_derivatives};
  }
};

struct ComponentGate {
  Component component{Component::SQ};
  double min_value{0.0};
};

// Static per-regime configuration. Weights are not required to sum to 1.
struct RegimeWeightMatrix {
  ScoringRegime regime{ScoringRegime::Transition};
  ComponentVector weights{};
  std::vector<ComponentGate> gates;
  const char* description{""};
};

struct ConfluenceResult {
  ScoringRegime regime{ScoringRegime::Transition};
  ComponentVector components{};  // clamped inputs
  ComponentVector weights{};
  ComponentVector breakdown{};
  double raw_score{0.0};
  double weighted_score{0.0};
  bool gated{false};
  std::vector<std::string> gate_violations;  // e.g. "TA=45 < gate 50"
  TradeBias bias{TradeBias::Neutral};
};

// Raw indicator context used to estimate components when the caller has no
// component scores of its own. Absent fields fall back to neutral values.
struct IndicatorContext {
  std::optional<double> scanner_score;
  std::optional<double> rsi;
  std::optional<double> adx;
  std::optional<double> cci;
  std::optional<double> volume_ratio;
  std::optional<std::string> session;  // "regular", "premarket", ...
  std::optional<int> mtf_alignment;    // 0-5 timeframes agreeing
  bool derivatives_available{false};
  std::optional<double> funding_rate;
  std::optional<double> oi_change_24h;
  std::optional<double> fear_greed;
  std::optional<double> iv_rank;
};

const char* toString(ScoringRegime r);
const char* toString(TradeBias b);
const char* toString(Component c);

std::optional<ScoringRegime> parseScoringRegime(std::string_view s);

// -------------------------------------------------------------------------
// regimeWeights(regime)
// -------------------------------------------------------------------------
// @brief  Returns the static weight matrix for a scoring regime.
// @return Reference to a table entry with static storage duration.
// -------------------------------------------------------------------------
const RegimeWeightMatrix& regimeWeights(ScoringRegime regime);

// -------------------------------------------------------------------------
// scoreConfluence(components, regime)
// -------------------------------------------------------------------------
// @brief  Computes the weighted score, gate violations and trade bias.
//
// @details
// Every failing gate is listed in gate_violations in table order. A single
// violation caps the score at 55, which forces at most CONDITIONAL.
// Re-scoring the same inputs always yields the same result.
// -------------------------------------------------------------------------
ConfluenceResult scoreConfluence(const ConfluenceComponents& components,
                                 ScoringRegime regime);

// Step function on the (possibly capped) score.
TradeBias tradeBiasFor(double weighted_score);

// Engine regime -> scoring regime.
ScoringRegime mapToScoringRegime(domain::Regime regime);

// -------------------------------------------------------------------------
// mapToScoringRegime(label)
// -------------------------------------------------------------------------
// @brief  Maps an engine regime name or free-text label to a scoring regime.
//
// @details
// Exact engine regime names are matched first. Free text is then matched by
// substring: TREND+MATURE, TREND, RANGE/COMPRESSION/CHOP, VOL/STRESS,
// TRANSITION. Anything else maps to TRANSITION, the most demanding regime.
// -------------------------------------------------------------------------
ScoringRegime mapToScoringRegime(std::string_view label);

// Heuristic component estimate from raw indicators.
ConfluenceComponents estimateComponents(const IndicatorContext& ctx);

}  // namespace tradegate
