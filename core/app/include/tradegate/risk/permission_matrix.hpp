#pragma once

#include "tradegate/domain/flow_types.hpp"
#include "tradegate/domain/governor_decision.hpp"
#include "tradegate/domain/market_types.hpp"
#include "tradegate/domain/trade_intent.hpp"
#include "tradegate/risk/cluster_resolver.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Permission matrix — the upstream hard governor
// -----------------------------------------------------------------------------
//
// @brief  Builds a point-in-time permission snapshot from session state and
//         evaluates one candidate trade against it.
//
// @details
// Two steps, both pure:
//
//   buildPermissionSnapshot(SnapshotInput)
//     Derives the risk mode, the per-trade risk cap, exposure caps, the
//     regime's strategy x direction permission table and the global blocks.
//
//   PermissionMatrix::evaluateCandidate(snapshot, candidate)
//     Starts from the table entry and downgrades it through a fixed sequence
//     of checks. Every check that fires appends its reason code and, for
//     blocking checks, a remediation string. Checks never upgrade.
//
// Risk mode:
//   LOCKED    data DOWN, no remaining daily R, open R >= 3 or >= 4 losses
//   THROTTLED high-severity event or >= 3 consecutive losses
//   DEFENSIVE data DEGRADED
//   NORMAL    otherwise
//
// When the guard is disabled every strategy is allowed, the mode reports
// NORMAL and evaluateCandidate returns ALLOW with GUARD_DISABLED.
// -----------------------------------------------------------------------------

inline constexpr double kBaseRiskPerTrade = 0.0075;
inline constexpr double kMaxDailyR = 2.0;
inline constexpr double kMaxOpenR = 3.0;
inline constexpr int kLossStreakThrottle = 3;
inline constexpr int kLossStreakLock = 4;
inline constexpr int kMaxCorrelatedSameCluster = 2;
inline constexpr int kMaxTradesPerDayEquities = 8;
inline constexpr int kMaxTradesPerDayCrypto = 12;
inline constexpr double kMaxDataAgeSeconds = 20.0;
inline constexpr double kSizingReferenceEquity = 100000.0;

inline constexpr std::size_t kStrategyCount = 6;

enum class BlockSeverity {
  Warn,
  Block,
};

const char* toString(BlockSeverity s);

struct GlobalBlock {
  std::string code;
  BlockSeverity severity{BlockSeverity::Warn};
  std::string message;
};

struct DirectionPermissions {
  domain::Permission long_side{domain::Permission::Block};
  domain::Permission short_side{domain::Permission::Block};

  domain::Permission of(domain::Direction d) const {
    return d == domain::Direction::Long ? long_side : short_side;
  }
};

// Indexed by StrategyTag.
using StrategyMatrix = std::array<DirectionPermissions, kStrategyCount>;

struct SnapshotInput {
  bool guard_enabled{true};
  domain::Regime regime{domain::Regime::RangeNeutral};
  domain::DataStatus data_status{domain::DataStatus::Ok};
  double data_age_seconds{3.0};
  domain::EventSeverity event_severity{domain::EventSeverity::None};
  double realized_daily_r{-1.2};
  double open_risk_r{2.2};
  int consecutive_losses{1};
  bool r_budget_halved{false};
  int trades_today{0};
  domain::Market market{domain::Market::Equities};
};

struct PermissionSnapshot {
  bool guard_enabled{true};
  domain::RiskMode risk_mode{domain::RiskMode::Normal};
  domain::Regime regime{domain::Regime::RangeNeutral};

  struct Session {
    double remaining_daily_r{0.0};
    double max_daily_r{kMaxDailyR};
    double open_risk_r{0.0};
    double max_open_risk_r{kMaxOpenR};
    int consecutive_losses{0};
    int trades_today{0};
    int max_trades_per_day{kMaxTradesPerDayEquities};
    bool trade_count_blocked{false};
  } session;

  struct DataHealth {
    domain::DataStatus status{domain::DataStatus::Ok};
    double max_age_s{kMaxDataAgeSeconds};
    double age_s{0.0};
  } data_health;

  struct Caps {
    double risk_per_trade{kBaseRiskPerTrade};
    double gross_max{1.5};
    double net_max{0.8};
    double cluster_max{0.6};
    double single_max{0.35};
    bool add_ons_allowed{true};
  } caps;

  StrategyMatrix matrix{};
  std::vector<GlobalBlock> global_blocks;
};

// Trade as seen by the permission matrix. stop_price is the final stop
// (explicit or ATR-derived).
struct CandidateIntent {
  std::string symbol;
  domain::Market market{domain::Market::Equities};
  domain::StrategyTag strategy_tag{domain::StrategyTag::TrendPullback};
  domain::Direction direction{domain::Direction::Long};
  double confidence{0.0};
  double entry_price{0.0};
  double stop_price{0.0};
  double atr{0.0};
  domain::EventSeverity event_severity{domain::EventSeverity::None};
  std::vector<domain::OpenPosition> open_positions;
};

domain::RiskMode inferRiskMode(domain::DataStatus data_status,
                               double remaining_daily_r, double open_risk_r,
                               domain::EventSeverity event_severity,
                               int consecutive_losses);

// Regime table; allow-all when the guard is disabled.
StrategyMatrix regimeMatrix(domain::Regime regime);
StrategyMatrix allowAllMatrix();

// Minimum stop distance in ATR multiples for a strategy and market.
double minStopAtrMultiple(domain::StrategyTag strategy, domain::Market market);

// Rank ALLOW 3 > ALLOW_REDUCED 2 > ALLOW_TIGHTENED 1 > BLOCK 0.
int permissionRank(domain::Permission p);

// The more restrictive of the two.
domain::Permission minPermission(domain::Permission a, domain::Permission b);

PermissionSnapshot buildPermissionSnapshot(const SnapshotInput& input);

// -----------------------------------------------------------------------------
// PermissionMatrix
// -----------------------------------------------------------------------------
//
// @brief  Evaluates candidates against a snapshot.
//
// @details
// Check order (each appends a reason code when it fires):
//   RISK_MODE_LOCKED, TRADE_COUNT_LIMIT, DATA_STALE, EVENT_BLOCK,
//   CONFIDENCE_BELOW_THRESHOLD, CORRELATED_CLUSTER_FULL / _WARNING,
//   STOP_WRONG_SIDE, STOP_EQUALS_ENTRY, STOP_TOO_TIGHT, NO_ADD_ONS.
// A clean non-blocked pass reports POLICY_CLEAR, SIZE_REDUCED or
// TRIGGER_ONLY for ALLOW, ALLOW_REDUCED and ALLOW_TIGHTENED respectively.
//
// The confidence floor is read from the permission reached so far
// (ALLOW 70, ALLOW_REDUCED 62, ALLOW_TIGHTENED 65, BLOCK 100).
//
// Thread model:
//   Stateless apart from the resolver reference; const and reentrant.
// -----------------------------------------------------------------------------
class PermissionMatrix {
 public:
  explicit PermissionMatrix(
      const IClusterResolver& clusters = StaticClusterResolver::instance());

  PermissionMatrix(const PermissionMatrix&) = delete;
  PermissionMatrix& operator=(const PermissionMatrix&) = delete;

  domain::PermissionVerdict evaluateCandidate(
      const PermissionSnapshot& snapshot,
      const CandidateIntent& candidate) const;

 private:
  const IClusterResolver& clusters_;
};

}  // namespace tradegate
