#include "tradegate/scoring/confluence_scorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tradegate {

namespace {

double clampComponent(double v) {
  if (!std::isfinite(v)) {
    return 50.0;
  }
  return std::clamp(v, 0.0, 100.0);
}

std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

// Weight order: SQ, TA, VA, LL, MTF, FD.
const std::array<RegimeWeightMatrix, 5>& matrices() {
  static const std::array<RegimeWeightMatrix, 5> kMatrices = {{
      {ScoringRegime::TrendExpansion,
       {0.20, 0.25, 0.15, 0.10, 0.20, 0.10},
       {{Component::TA, 50.0}, {Component::MTF, 40.0}},
       "Strong trend. Technical alignment and multi-timeframe drive "
       "conviction."},
      {ScoringRegime::TrendMature,
       {0.15, 0.20, 0.20, 0.10, 0.15, 0.20},
       {{Component::VA, 40.0}, {Component::FD, 35.0}},
       "Aging trend. Volume confirmation and derivatives divergence "
       "become critical."},
      {ScoringRegime::RangeCompression,
       {0.25, 0.15, 0.20, 0.15, 0.10, 0.15},
       {{Component::SQ, 55.0}, {Component::LL, 40.0}},
       "Range or chop. Signal quality must be exceptional."},
      {ScoringRegime::VolExpansion,
       {0.15, 0.15, 0.10, 0.25, 0.10, 0.25},
       {{Component::LL, 50.0}, {Component::FD, 40.0}},
       "Volatility spiking. Liquidity and fundamental context dominate."},
      {ScoringRegime::Transition,
       {0.20, 0.15, 0.15, 0.15, 0.20, 0.15},
       {{Component::MTF, 50.0}, {Component::SQ, 50.0}},
       "Regime uncertain. Multi-timeframe confirmation and signal quality "
       "required."},
  }};
  return kMatrices;
}

}  // namespace

// ---- string conversions ----

const char* toString(ScoringRegime r) {
  switch (r) {
    case ScoringRegime::TrendExpansion:   return "TREND_EXPANSION";
    case ScoringRegime::TrendMature:      return "TREND_MATURE";
    case ScoringRegime::RangeCompression: return "RANGE_COMPRESSION";
    case ScoringRegime::VolExpansion:     return "VOL_EXPANSION";
    case ScoringRegime::Transition:       return "TRANSITION";
  }
  return "UNKNOWN";
}

const char* toString(TradeBias b) {
  switch (b) {
    case TradeBias::Neutral:        return "NEUTRAL";
    case TradeBias::Conditional:    return "CONDITIONAL";
    case TradeBias::Valid:          return "VALID";
    case TradeBias::HighConfluence: return "HIGH_CONFLUENCE";
  }
  return "UNKNOWN";
}

const char* toString(Component c) {
  switch (c) {
    case Component::SQ:  return "SQ";
    case Component::TA:  return "TA";
    case Component::VA:  return "VA";
    case Component::LL:  return "LL";
    case Component::MTF: return "MTF";
    case Component::FD:  return "FD";
  }
  return "?";
}

std::optional<ScoringRegime> parseScoringRegime(std::string_view s) {
  const auto u = upper(s);
  if (u == "TREND_EXPANSION") return ScoringRegime::TrendExpansion;
  if (u == "TREND_MATURE") return ScoringRegime::TrendMature;
  if (u == "RANGE_COMPRESSION") return ScoringRegime::RangeCompression;
  if (u == "VOL_EXPANSION") return ScoringRegime::VolExpansion;
  if (u == "TRANSITION") return ScoringRegime::Transition;
  return std::nullopt;
}

// ---- regimeWeights ----

const RegimeWeightMatrix& regimeWeights(ScoringRegime regime) {
  return matrices()[static_cast<std::size_t>(regime)];
}

// ---- tradeBiasFor ----

TradeBias tradeBiasFor(double weighted_score) {
  if (weighted_score < 55.0) return TradeBias::Neutral;
  if (weighted_score < 70.0) return TradeBias::Conditional;
  if (weighted_score < 85.0) return TradeBias::Valid;
  return TradeBias::HighConfluence;
}

// ---- scoreConfluence ----

ConfluenceResult scoreConfluence(const ConfluenceComponents& components,
                                 ScoringRegime regime) {
  const RegimeWeightMatrix& matrix = regimeWeights(regime);

  ConfluenceResult result;
  result.regime = regime;
  result.weights = matrix.weights;

  const ComponentVector raw = components.asVector();
  for (std::size_t i = 0; i < kComponentCount; ++i) {
    result.components[i] = clampComponent(raw[i]);
    result.breakdown[i] = result.components[i] * matrix.weights[i];
    result.raw_score += result.breakdown[i];
  }

  for (const auto& gate : matrix.gates) {
    const double value =
        result.components[static_cast<std::size_t>(gate.component)];
    if (value < gate.min_value) {
      std::ostringstream os;
      os << toString(gate.component) << "=" << std::fixed
         << std::setprecision(0) << value << " < gate " << gate.min_value;
      result.gate_violations.push_back(os.str());
    }
  }

  result.gated = !result.gate_violations.empty();
  result.weighted_score = result.gated
                              ? std::min(result.raw_score, kGatedScoreCap)
                              : std::clamp(result.raw_score, 0.0, 100.0);
  result.bias = tradeBiasFor(result.weighted_score);
  return result;
}

// ---- mapToScoringRegime ----

ScoringRegime mapToScoringRegime(domain::Regime regime) {
  using domain::Regime;
  switch (regime) {
    case Regime::TrendUp:
    case Regime::TrendDown:
      return ScoringRegime::TrendExpansion;
    case Regime::RangeNeutral:
    case Regime::VolContraction:
      return ScoringRegime::RangeCompression;
    case Regime::VolExpansion:
    case Regime::RiskOffStress:
      return ScoringRegime::VolExpansion;
  }
  return ScoringRegime::Transition;
}

ScoringRegime mapToScoringRegime(std::string_view label) {
  if (auto exact = domain::parseRegime(label)) {
    return mapToScoringRegime(*exact);
  }
  if (auto scoring = parseScoringRegime(label)) {
    return *scoring;
  }

  const auto r = upper(label);
  if (contains(r, "TREND") && contains(r, "MATURE")) {
    return ScoringRegime::TrendMature;
  }
  if (contains(r, "TREND")) return ScoringRegime::TrendExpansion;
  if (contains(r, "RANGE") || contains(r, "COMPRESSION") ||
      contains(r, "CHOP")) {
    return ScoringRegime::RangeCompression;
  }
  if (contains(r, "VOL") || contains(r, "STRESS")) {
    return ScoringRegime::VolExpansion;
  }
  return ScoringRegime::Transition;
}

// ---- estimateComponents ----

ConfluenceComponents estimateComponents(const IndicatorContext& ctx) {
  ConfluenceComponents c;

  c.signal_quality = clampComponent(ctx.scanner_score.value_or(50.0));

  double ta = 50.0;
  if (ctx.rsi) {
    const double rsi = *ctx.rsi;
    if (rsi > 50.0 && rsi < 70.0) {
      ta += 15.0;
    } else if (rsi < 50.0 && rsi > 30.0) {
      ta -= 10.0;
    } else if (rsi >= 70.0 || rsi <= 30.0) {
      ta -= 5.0;
    }
  }
  if (ctx.adx) {
    if (*ctx.adx > 25.0) {
      ta += 10.0;
    } else if (*ctx.adx < 15.0) {
      ta -= 10.0;
    }
  }
  if (ctx.cci) {
    if (*ctx.cci > 0.0) {
      ta += 5.0;
    } else if (*ctx.cci < -100.0) {
      ta -= 10.0;
    }
  }
  c.technical_alignment = clampComponent(ta);

  double va = 50.0;
  if (ctx.volume_ratio) {
    const double vr = *ctx.volume_ratio;
    if (vr > 1.5) {
      va += 20.0;
    } else if (vr > 1.0) {
      va += 10.0;
    } else if (vr < 0.6) {
      va -= 15.0;
    }
  }
  c.volume_activity = clampComponent(va);

  // Regular session is assumed when the caller does not say.
  double ll = 60.0;
  if (ctx.session) {
    const auto s = upper(*ctx.session);
    if (s == "PREMARKET" || s == "AFTERHOURS") {
      ll = 40.0;
    } else if (s == "CLOSED") {
      ll = 20.0;
    } else if (s == "REGULAR") {
      ll = 70.0;
    }
  }
  c.liquidity_level = clampComponent(ll);

  c.mtf_agreement = clampComponent(ctx.mtf_alignment.value_or(2) * 20.0);

  double fd = 45.0;
  if (ctx.derivatives_available) {
    fd = 55.0;
    if (ctx.oi_change_24h && std::abs(*ctx.oi_change_24h) > 5.0) fd += 10.0;
    if (ctx.funding_rate && std::abs(*ctx.funding_rate) > 0.05) fd += 5.0;
    if (ctx.fear_greed && (*ctx.fear_greed < 25.0 || *ctx.fear_greed > 75.0)) {
      fd += 10.0;
    }
  }
  if (ctx.iv_rank && (*ctx.iv_rank > 70.0 || *ctx.iv_rank < 30.0)) {
    fd += 5.0;
  }
  c.fundamental_derivatives = clampComponent(fd);

  return c;
}

}  // namespace tradegate
