#include "tradegate/risk/permission_matrix.hpp"

#include "tradegate/risk/reason_codes.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradegate {

using domain::DataStatus;
using domain::Direction;
using domain::EventSeverity;
using domain::Market;
using domain::Permission;
using domain::Regime;
using domain::RiskMode;
using domain::StrategyTag;

namespace {

constexpr Permission A = Permission::Allow;
constexpr Permission AR = Permission::AllowReduced;
constexpr Permission AT = Permission::AllowTightened;
constexpr Permission B = Permission::Block;

double round2(double v) { return std::round(v * 100.0) / 100.0; }

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

std::size_t idx(StrategyTag t) { return static_cast<std::size_t>(t); }

// Rows in StrategyTag order: TP, BO, MR, RF, MOM, EV.
StrategyMatrix rows(DirectionPermissions tp, DirectionPermissions bo,
                    DirectionPermissions mr, DirectionPermissions rf,
                    DirectionPermissions mom, DirectionPermissions ev) {
  StrategyMatrix m{};
  m[idx(StrategyTag::TrendPullback)] = tp;
  m[idx(StrategyTag::BreakoutContinuation)] = bo;
  m[idx(StrategyTag::MeanReversion)] = mr;
  m[idx(StrategyTag::RangeFade)] = rf;
  m[idx(StrategyTag::MomentumReversal)] = mom;
  m[idx(StrategyTag::EventStrategy)] = ev;
  return m;
}

double riskMultiplier(RiskMode mode) {
  switch (mode) {
    case RiskMode::Locked:    return 0.0;
    case RiskMode::Throttled: return 0.5;
    case RiskMode::Defensive: return 0.35;
    case RiskMode::Normal:    return 1.0;
  }
  return 0.0;
}

double confidenceFloor(Permission p) {
  switch (p) {
    case Permission::Allow:          return 70.0;
    case Permission::AllowReduced:   return 62.0;
    case Permission::AllowTightened: return 65.0;
    case Permission::Block:          return 100.0;
  }
  return 100.0;
}

double maxPositionSize(double risk_per_trade, double stop_distance) {
  const double per_unit = std::max(0.0001, stop_distance);
  return std::max(0.0,
                  std::floor(kSizingReferenceEquity * risk_per_trade / per_unit));
}

std::string formatNumber(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

}  // namespace

const char* toString(BlockSeverity s) {
  return s == BlockSeverity::Block ? "BLOCK" : "WARN";
}

// ---- inferRiskMode ----

RiskMode inferRiskMode(DataStatus data_status, double remaining_daily_r,
                       double open_risk_r, EventSeverity event_severity,
                       int consecutive_losses) {
  if (data_status == DataStatus::Down) return RiskMode::Locked;
  if (remaining_daily_r <= 0.0) return RiskMode::Locked;
  if (open_risk_r >= kMaxOpenR) return RiskMode::Locked;
  if (consecutive_losses >= kLossStreakLock) return RiskMode::Locked;
  if (event_severity == EventSeverity::High) return RiskMode::Throttled;
  if (consecutive_losses >= kLossStreakThrottle) return RiskMode::Throttled;
  if (data_status == DataStatus::Degraded) return RiskMode::Defensive;
  return RiskMode::Normal;
}

// ---- regimeMatrix ----

StrategyMatrix regimeMatrix(Regime regime) {
  const DirectionPermissions block{B, B};
  switch (regime) {
    case Regime::TrendUp:
      return rows(/*TP*/ {A, B}, /*BO*/ {A, B}, /*MR*/ {AR, B}, /*RF*/ block,
                  /*MOM*/ block, /*EV*/ {AR, AR});
    case Regime::TrendDown:
      return rows({B, AR}, {B, AR}, {AR, AR}, block, block, {AR, AR});
    case Regime::RangeNeutral:
      return rows({AT, AT}, {AT, AT}, {A, A}, {A, A}, {AT, AT}, {AR, AR});
    case Regime::VolExpansion:
      return rows({AR, AR}, {AR, AR}, {AT, AT}, {AR, AR}, block, {AR, AR});
    case Regime::VolContraction:
      return rows({AT, AT}, {AT, AT}, {A, A}, {A, A}, block, {AR, AR});
    case Regime::RiskOffStress:
      return rows({B, AR}, block, {AR, AR}, {AR, AR}, block, {AR, AR});
  }
  return rows(block, block, block, block, block, block);
}

StrategyMatrix allowAllMatrix() {
  const DirectionPermissions both{A, A};
  return rows(both, both, both, both, both, both);
}

// ---- minStopAtrMultiple ----

double minStopAtrMultiple(StrategyTag strategy, Market market) {
  const bool crypto = market == Market::Crypto;
  switch (strategy) {
    case StrategyTag::BreakoutContinuation: return crypto ? 1.0 : 0.8;
    case StrategyTag::TrendPullback:        return crypto ? 0.8 : 0.6;
    case StrategyTag::RangeFade:            return crypto ? 0.7 : 0.5;
    case StrategyTag::MeanReversion:        return crypto ? 0.8 : 0.6;
    case StrategyTag::MomentumReversal:     return crypto ? 1.0 : 0.8;
    case StrategyTag::EventStrategy:        return crypto ? 0.9 : 0.8;
  }
  return 1.0;
}

// ---- ranks ----

int permissionRank(Permission p) {
  switch (p) {
    case Permission::Allow:          return 3;
    case Permission::AllowReduced:   return 2;
    case Permission::AllowTightened: return 1;
    case Permission::Block:          return 0;
  }
  return 0;
}

Permission minPermission(Permission a, Permission b) {
  return permissionRank(a) <= permissionRank(b) ? a : b;
}

// ---- buildPermissionSnapshot ----

PermissionSnapshot buildPermissionSnapshot(const SnapshotInput& input) {
  const bool enabled = input.guard_enabled;
  const double max_daily_r =
      input.r_budget_halved ? kMaxDailyR * 0.5 : kMaxDailyR;
  const double remaining =
      std::max(0.0, round2(max_daily_r + input.realized_daily_r));

  const RiskMode mode =
      inferRiskMode(input.data_status, remaining, input.open_risk_r,
                    input.event_severity, input.consecutive_losses);

  PermissionSnapshot s;
  s.guard_enabled = enabled;
  s.risk_mode = enabled ? mode : RiskMode::Normal;
  s.regime = input.regime;
  s.matrix = enabled ? regimeMatrix(input.regime) : allowAllMatrix();

  s.session.remaining_daily_r = remaining;
  s.session.max_daily_r = max_daily_r;
  s.session.open_risk_r = round2(input.open_risk_r);
  s.session.consecutive_losses = input.consecutive_losses;
  s.session.trades_today = std::max(0, input.trades_today);
  s.session.max_trades_per_day = input.market == Market::Crypto
                                     ? kMaxTradesPerDayCrypto
                                     : kMaxTradesPerDayEquities;
  s.session.trade_count_blocked =
      enabled && s.session.trades_today >= s.session.max_trades_per_day;

  s.data_health.status = input.data_status;
  s.data_health.age_s = std::max(0.0, input.data_age_seconds);

  const bool throttled = enabled && mode == RiskMode::Throttled;
  s.caps.risk_per_trade =
      round4(kBaseRiskPerTrade * (enabled ? riskMultiplier(mode) : 1.0));
  s.caps.gross_max = throttled ? 1.2 : 1.5;
  s.caps.net_max = throttled ? 0.7 : 0.8;
  s.caps.add_ons_allowed = enabled ? mode == RiskMode::Normal : true;

  if (enabled) {
    if (input.event_severity == EventSeverity::High) {
      s.global_blocks.push_back({reason::kEventThrottle, BlockSeverity::Warn,
                                 "High-impact event window active."});
    }
    if (mode == RiskMode::Locked) {
      s.global_blocks.push_back({reason::kRiskLocked, BlockSeverity::Block,
                                 "Risk governor is LOCKED. New trades disabled."});
    }
    if (input.data_status == DataStatus::Down) {
      s.global_blocks.push_back({reason::kDataDown, BlockSeverity::Block,
                                 "Market data feed unavailable."});
    } else if (input.data_status == DataStatus::Degraded) {
      s.global_blocks.push_back({reason::kDataDegraded, BlockSeverity::Warn,
                                 "Market data feed degraded."});
    }
    if (s.session.trade_count_blocked) {
      s.global_blocks.push_back(
          {reason::kTradeCountLimit, BlockSeverity::Block,
           "Daily trade count limit reached (" +
               std::to_string(s.session.trades_today) + "/" +
               std::to_string(s.session.max_trades_per_day) +
               "). No new trades allowed."});
    }
  }
  return s;
}

// ---- PermissionMatrix ----

PermissionMatrix::PermissionMatrix(const IClusterResolver& clusters)
    : clusters_(clusters) {}

domain::PermissionVerdict PermissionMatrix::evaluateCandidate(
    const PermissionSnapshot& snapshot,
    const CandidateIntent& candidate) const {
  domain::PermissionVerdict v;
  v.risk_per_trade = snapshot.caps.risk_per_trade;
  v.constraints.max_gross_exposure = snapshot.caps.gross_max;
  v.constraints.max_net_exposure = snapshot.caps.net_max;
  v.constraints.max_open_risk_r = snapshot.session.max_open_risk_r;

  const double stop_distance =
      std::abs(candidate.entry_price - candidate.stop_price);
  v.max_position_size = maxPositionSize(v.risk_per_trade, stop_distance);

  if (!snapshot.guard_enabled) {
    v.permission = Permission::Allow;
    v.risk_mode = RiskMode::Normal;
    v.reason_codes.push_back(reason::kGuardDisabled);
    return v;
  }

  v.risk_mode = snapshot.risk_mode;
  Permission permission =
      snapshot.matrix[idx(candidate.strategy_tag)].of(candidate.direction);

  auto block = [&](const char* code, std::string action) {
    permission = Permission::Block;
    v.reason_codes.push_back(code);
    v.required_actions.push_back(std::move(action));
  };

  if (snapshot.risk_mode == RiskMode::Locked) {
    block(reason::kRiskModeLocked, "Reduce or close risk before new entries.");
  }

  if (snapshot.session.trade_count_blocked) {
    block(reason::kTradeCountLimit,
          "Daily trade limit reached (" +
              std::to_string(snapshot.session.trades_today) + "/" +
              std::to_string(snapshot.session.max_trades_per_day) +
              "). No new trades allowed today.");
  }

  if (snapshot.data_health.status == DataStatus::Down) {
    block(reason::kDataStale, "Wait for feed recovery.");
  }

  if (candidate.event_severity == EventSeverity::High &&
      candidate.strategy_tag != StrategyTag::EventStrategy) {
    block(reason::kEventBlock,
          "Use EVENT_STRATEGY or wait until event window passes.");
  }

  const double floor = confidenceFloor(permission);
  if (candidate.confidence < floor) {
    block(reason::kConfidenceBelowThreshold,
          "Raise setup quality to >= " + formatNumber(floor) + "% confidence.");
  }

  if (!candidate.open_positions.empty()) {
    const std::string cluster =
        clusters_.resolve(candidate.market, candidate.symbol);
    const auto same = std::count_if(
        candidate.open_positions.begin(), candidate.open_positions.end(),
        [&](const domain::OpenPosition& p) {
          return p.direction == candidate.direction &&
                 clusters_.resolve(domain::marketFor(p.asset_class),
                                   p.symbol) == cluster;
        });

    if (same >= kMaxCorrelatedSameCluster) {
      block(reason::kCorrelatedClusterFull,
            "Max " + std::to_string(kMaxCorrelatedSameCluster) + " " +
                domain::toString(candidate.direction) +
                " positions in cluster " + cluster +
                ". Close an existing position first.");
    } else if (same == kMaxCorrelatedSameCluster - 1 &&
               permission == Permission::Allow) {
      permission = Permission::AllowReduced;
      v.reason_codes.push_back(reason::kCorrelatedClusterWarning);
      v.required_actions.push_back("Approaching cluster limit for " + cluster +
                                   ". Size reduced.");
    }
  }

  if (candidate.direction == Direction::Long &&
      candidate.stop_price >= candidate.entry_price) {
    block(reason::kStopWrongSide, "LONG stop must be below entry price.");
  } else if (candidate.direction == Direction::Short &&
             candidate.stop_price <= candidate.entry_price) {
    block(reason::kStopWrongSide, "SHORT stop must be above entry price.");
  }

  if (candidate.stop_price == candidate.entry_price) {
    block(reason::kStopEqualsEntry, "Stop price cannot equal entry price.");
  }

  const double min_distance =
      minStopAtrMultiple(candidate.strategy_tag, candidate.market) *
      candidate.atr;
  if (stop_distance < min_distance) {
    block(reason::kStopTooTight,
          "Widen stop to at least " + formatNumber(round2(min_distance)) + ".");
  }

  if (!snapshot.caps.add_ons_allowed && permission != Permission::Block) {
    v.reason_codes.push_back(reason::kNoAddOns);
  }

  if (v.reason_codes.empty() && permission != Permission::Block) {
    v.reason_codes.push_back(permission == Permission::Allow
                                 ? reason::kPolicyClear
                             : permission == Permission::AllowReduced
                                 ? reason::kSizeReduced
                                 : reason::kTriggerOnly);
  }

  v.permission = permission;
  v.required_stop_min_distance = round2(min_distance);
  v.constraints.no_add_ons = !snapshot.caps.add_ons_allowed;
  v.constraints.trigger_only = permission == Permission::AllowTightened;
  return v;
}

}  // namespace tradegate
