#pragma once

#include "tradegate/domain/flow_types.hpp"
#include "tradegate/flow/session_overlay.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Flow/state trade permission
// -----------------------------------------------------------------------------
//
// @brief  Scores how well a trade archetype fits the current institutional
//         flow state and decides whether it may be taken.
//
// @details
//   TPS = 0.5 * institutional probability
//       + 0.3 * alignment(state, archetype)
//       + 0.1 * data health
//       + 0.1 * liquidity clarity                (all on 0..1)
//
//   Auto no-trade (independent of TPS):
//     - data health < 55, or
//     - ACCUMULATION with volatility compression >= 70, ATR expansion <= 35
//       and liquidity clarity < 45.
//
//   Blocked when auto no-trade fires or TPS < 0.65.
//
// Session overlay:
//   Applied after the base decision. It shifts TPS by tps_adjustment/100,
//   forces TPS under the session minimum when the confidence or liquidity
//   gate fails, caps the size multiplier, appends its allow/block lists and
//   may override the stop style. The decision with an overlay is
//
//     blocked = auto_no_trade
//            || base TPS < 0.65
//            || adjusted TPS < max(0.65, minimum_tps / 100)
//
//   so a positive session adjustment or a lower session minimum can never
//   unblock a trade the base rules blocked.
//
// Pure; safe to call from any thread.
// -----------------------------------------------------------------------------

inline constexpr double kBaseTpsThreshold = 0.65;
inline constexpr double kStaleDataHealth = 55.0;
inline constexpr double kBlockedSizeCeiling = 0.35;

enum class FlowRiskMode {
  Low,
  Medium,
  High,
};

const char* toString(FlowRiskMode m);

using ArchetypeAlignment = std::array<double, domain::kArchetypeCount>;

struct FlowPermissionInput {
  domain::FlowState state{domain::FlowState::Neutral};
  // All on 0..100.
  double state_confidence{0.0};
  double institutional_probability{0.0};
  double p_trend{0.0};
  double p_pin{0.0};
  double p_expansion{0.0};
  double data_health_score{0.0};
  double liquidity_clarity{0.0};
  double volatility_compression{0.0};
  double atr_expansion_rate{0.0};
  domain::TradeArchetype preferred_archetype{
      domain::TradeArchetype::TrendContinuation};
  std::optional<SessionOverlay> session_overlay;
};

struct SessionAdjustment {
  SessionPhase phase{SessionPhase::Unknown};
  double tps_adjustment{0.0};
  bool size_cap_applied{false};
  bool restrictive{false};
  std::string reason;
};

struct FlowPermission {
  domain::FlowState state{domain::FlowState::Neutral};
  // 0..100, one decimal.
  double tps{0.0};
  bool blocked{true};

  struct NoTradeMode {
    bool active{false};
    std::string reason;
  } no_trade_mode;

  FlowRiskMode risk_mode{FlowRiskMode::High};
  double size_multiplier{0.0};
  domain::StopStyle stop_style{domain::StopStyle::Structural};
  std::vector<std::string> allowed;
  std::vector<std::string> blocked_trades;
  ArchetypeAlignment alignment_by_archetype{};
  domain::TradeArchetype selected_archetype{
      domain::TradeArchetype::TrendContinuation};
  std::optional<SessionAdjustment> session_adjustment;
};

// Alignment of every archetype with a flow state (indexed by TradeArchetype).
ArchetypeAlignment alignmentFor(domain::FlowState state);

FlowPermission computeFlowTradePermission(const FlowPermissionInput& input);

}  // namespace tradegate
