#include "tradegate/flow/flow_trade_permission.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace tradegate {

using domain::FlowState;
using domain::StopStyle;
using domain::TradeArchetype;

namespace {

double clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

double round1(double v) { return std::round(v * 10.0) / 10.0; }
double round2(double v) { return std::round(v * 100.0) / 100.0; }

struct StatePolicy {
  double size_multiplier;
  StopStyle stop_style;
  FlowRiskMode risk_mode;
  std::vector<std::string> allowed;
  std::vector<std::string> blocked;
};

StatePolicy policyFor(FlowState state) {
  switch (state) {
    case FlowState::Accumulation:
      return {0.4, StopStyle::TightStructural, FlowRiskMode::Low,
              {"Range bounces at liquidity edges", "VWAP reversion",
               "Fade extremes (high confidence)"},
              {"Breakout chasing", "Momentum entries",
               "Late trend continuation"}};
    case FlowState::Positioning:
      return {0.7, StopStyle::Structural, FlowRiskMode::Medium,
              {"Pullbacks aligned with bias", "Early breakout prep",
               "Compression break alerts"},
              {"Late breakout entries", "Counter-trend scalps"}};
    case FlowState::Launch:
      return {1.0, StopStyle::AtrTrailing, FlowRiskMode::High,
              {"Trend continuation", "Breakout retests", "Momentum add-ons"},
              {"Counter-trend fades", "Early reversal guesses"}};
    case FlowState::Exhaustion:
      return {0.5, StopStyle::WiderConfirmation, FlowRiskMode::Medium,
              {"Profit-taking", "Confirmed reversals",
               "Mean reversion to VWAP"},
              {"New trend entries", "Breakout continuation"}};
    case FlowState::Neutral:
      break;
  }
  return {0.5, StopStyle::Structural, FlowRiskMode::Medium,
          {"Wait for state confirmation"},
          {"Aggressive continuation entries"}};
}

std::string belowThresholdReason(double tps, double threshold) {
  std::ostringstream os;
  os << "BLOCKED: Trade Permission Score " << std::lround(tps * 100.0)
     << " below threshold (" << std::lround(threshold * 100.0) << ")";
  return os.str();
}

}  // namespace

const char* toString(FlowRiskMode m) {
  switch (m) {
    case FlowRiskMode::Low: return "low";
    case FlowRiskMode::Medium: return "medium";
    case FlowRiskMode::High: return "high";
  }
  return "high";
}

// Order: TC, BREAKOUT_EARLY, BREAKOUT_LATE, PULLBACK, MEAN_REVERSION,
// COUNTER_TREND_FADE, REVERSAL_CONFIRMED, MOMENTUM_ADD.
ArchetypeAlignment alignmentFor(FlowState state) {
  switch (state) {
    case FlowState::Accumulation:
      return {0.20, 0.35, 0.10, 0.45, 1.00, 0.65, 0.55, 0.10};
    case FlowState::Positioning:
      return {0.65, 1.00, 0.30, 0.80, 0.35, 0.20, 0.25, 0.55};
    case FlowState::Launch:
      return {1.00, 0.85, 0.65, 0.80, 0.20, 0.10, 0.20, 0.95};
    case FlowState::Exhaustion:
      return {0.25, 0.20, 0.10, 0.30, 0.75, 0.60, 1.00, 0.15};
    case FlowState::Neutral:
      break;
  }
  return {0.40, 0.40, 0.25, 0.45, 0.45, 0.35, 0.40, 0.35};
}

// ---- computeFlowTradePermission ----
FlowPermission computeFlowTradePermission(const FlowPermissionInput& input) {
  const ArchetypeAlignment alignment = alignmentFor(input.state);
  StatePolicy policy = policyFor(input.state);

  const double align =
      alignment[static_cast<std::size_t>(input.preferred_archetype)];
  const double base_tps = clamp01(input.institutional_probability / 100.0) * 0.5 +
                          align * 0.3 +
                          clamp01(input.data_health_score / 100.0) * 0.1 +
                          clamp01(input.liquidity_clarity / 100.0) * 0.1;

  double tps = base_tps;
  double threshold = kBaseTpsThreshold;
  const SessionOverlay* so =
      input.session_overlay ? &*input.session_overlay : nullptr;

  if (so) {
    tps = clamp01(tps + so->tps_adjustment / 100.0);
    const bool fails_confidence = so->minimum_confidence > 0.0 &&
                                  input.state_confidence < so->minimum_confidence;
    const bool fails_liquidity =
        so->minimum_liquidity_clarity > 0.0 &&
        input.liquidity_clarity < so->minimum_liquidity_clarity;
    if (fails_confidence || fails_liquidity) {
      tps = std::min(tps, (so->minimum_tps - 1.0) / 100.0);
    }
    threshold = std::max(kBaseTpsThreshold, so->minimum_tps / 100.0);
  }

  const bool low_volatility =
      input.volatility_compression >= 70.0 && input.atr_expansion_rate <= 35.0;
  const bool unclear_liquidity = input.liquidity_clarity < 45.0;
  const bool stale_data = input.data_health_score < kStaleDataHealth;
  const bool auto_no_trade =
      (input.state == FlowState::Accumulation && low_volatility &&
       unclear_liquidity) ||
      stale_data;

  const bool base_below = base_tps < kBaseTpsThreshold;
  const bool adjusted_below = tps < threshold;
  const bool blocked = auto_no_trade || base_below || adjusted_below;

  FlowPermission out;
  out.state = input.state;
  out.blocked = blocked;
  out.no_trade_mode.active = auto_no_trade;
  if (auto_no_trade && stale_data) {
    out.no_trade_mode.reason = "NO-TRADE MODE: data health stale";
  } else if (auto_no_trade) {
    out.no_trade_mode.reason =
        "NO-TRADE MODE: accumulation + low volatility + unclear liquidity";
  } else if (adjusted_below) {
    out.no_trade_mode.reason = belowThresholdReason(tps, threshold);
  } else if (base_below) {
    out.no_trade_mode.reason =
        belowThresholdReason(base_tps, kBaseTpsThreshold);
  } else {
    out.no_trade_mode.reason = "Permission granted";
  }

  double size = blocked ? std::min(policy.size_multiplier, kBlockedSizeCeiling)
                        : policy.size_multiplier;
  StopStyle stop = policy.stop_style;

  if (so) {
    SessionAdjustment adj;
    adj.phase = so->phase;
    adj.tps_adjustment = so->tps_adjustment;
    adj.restrictive = so->restrictive;
    adj.reason = so->reason;
    if (size > so->size_multiplier_cap) {
      size = so->size_multiplier_cap;
      adj.size_cap_applied = true;
    }
    out.session_adjustment = std::move(adj);

    policy.allowed.insert(policy.allowed.end(), so->session_allowed.begin(),
                          so->session_allowed.end());
    policy.blocked.insert(policy.blocked.end(), so->session_blocked.begin(),
                          so->session_blocked.end());
    if (so->stop_style_override) stop = *so->stop_style_override;
  }

  out.tps = round1(tps * 100.0);
  out.risk_mode = blocked ? FlowRiskMode::High : policy.risk_mode;
  out.size_multiplier = round2(size);
  out.stop_style = stop;
  out.allowed = std::move(policy.allowed);
  out.blocked_trades = std::move(policy.blocked);
  out.alignment_by_archetype = alignment;
  out.selected_archetype = input.preferred_archetype;
  return out;
}

}  // namespace tradegate
