#pragma once

namespace tradegate {
namespace reason {

// Closed set of reason codes surfaced by the governors and the pipeline.
// Callers compare against these constants; the strings are wire values.

// ---- permission matrix ----
inline constexpr const char* kGuardDisabled = "GUARD_DISABLED";
inline constexpr const char* kRiskModeLocked = "RISK_MODE_LOCKED";
inline constexpr const char* kTradeCountLimit = "TRADE_COUNT_LIMIT";
inline constexpr const char* kDataStale = "DATA_STALE";
inline constexpr const char* kEventBlock = "EVENT_BLOCK";
inline constexpr const char* kConfidenceBelowThreshold =
    "CONFIDENCE_BELOW_THRESHOLD";
inline constexpr const char* kCorrelatedClusterFull = "CORRELATED_CLUSTER_FULL";
inline constexpr const char* kCorrelatedClusterWarning =
    "CORRELATED_CLUSTER_WARNING";
inline constexpr const char* kStopWrongSide = "STOP_WRONG_SIDE";
inline constexpr const char* kStopEqualsEntry = "STOP_EQUALS_ENTRY";
inline constexpr const char* kStopTooTight = "STOP_TOO_TIGHT";
inline constexpr const char* kNoAddOns = "NO_ADD_ONS";
inline constexpr const char* kPolicyClear = "POLICY_CLEAR";
inline constexpr const char* kSizeReduced = "SIZE_REDUCED";
inline constexpr const char* kTriggerOnly = "TRIGGER_ONLY";

// ---- snapshot global blocks ----
inline constexpr const char* kEventThrottle = "EVENT_THROTTLE";
inline constexpr const char* kRiskLocked = "RISK_LOCKED";
inline constexpr const char* kDataDown = "DATA_DOWN";
inline constexpr const char* kDataDegraded = "DATA_DEGRADED";

// ---- execution governor ----
inline constexpr const char* kExecDailyLossCap = "EXEC_DAILY_LOSS_CAP";
inline constexpr const char* kExecPortfolioHeat = "EXEC_PORTFOLIO_HEAT";
inline constexpr const char* kExecMaxOpenTrades = "EXEC_MAX_OPEN_TRADES";
inline constexpr const char* kExecMinRr = "EXEC_MIN_RR";
inline constexpr const char* kExecSingleTradeRisk = "EXEC_SINGLE_TRADE_RISK";

// ---- pipeline failures ----
inline constexpr const char* kNoAtr = "NO_ATR";
inline constexpr const char* kBadExits = "BAD_EXITS";
inline constexpr const char* kGovernorBlock = "GOVERNOR_BLOCK";

}  // namespace reason
}  // namespace tradegate
