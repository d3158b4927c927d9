#pragma once

#include <optional>
#include <string_view>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// Closed enumerations shared by every decision module
// -----------------------------------------------------------------------------
//
// @brief  The vocabulary of a trade decision: what is traded, in which
//         direction, under which regime and strategy, and how the governors
//         answer.
//
// @details
// Every "by regime" / "by asset class" / "by strategy" table in the engine
// is an exhaustive switch over one of these enums. Adding an enumerator
// makes the compiler flag each table that has not been extended
// (-Wswitch is enabled in CMakeLists.txt).
//
// Wire strings:
//   toString() returns the canonical string used in JSON payloads and log
//   lines. The parseX() functions accept the same strings (case-insensitive)
//   and return std::nullopt for anything else; callers decide whether an
//   unknown value is an error or falls back to a default.
// -----------------------------------------------------------------------------

enum class AssetClass {
  Equity,
  Crypto,
  Futures,
  Forex,
  Options,
};

enum class Direction {
  Long,
  Short,
};

enum class StrategyTag {
  TrendPullback,
  BreakoutContinuation,
  MeanReversion,
  RangeFade,
  MomentumReversal,
  EventStrategy,
};

enum class Regime {
  TrendUp,
  TrendDown,
  RangeNeutral,
  VolExpansion,
  VolContraction,
  RiskOffStress,
};

// Operating mode chosen by the permission snapshot (execution side).
enum class RiskMode {
  Normal,
  Throttled,
  Defensive,
  Locked,
};

// Permission verdict, ordered from most to least permissive.
enum class Permission {
  Allow,
  AllowReduced,
  AllowTightened,
  Block,
};

enum class TrailRule {
  None,
  Atr1x,
  Atr1_5x,
  Atr2x,
  BreakevenAfter1R,
  Chandelier,
  PercentTrail,
};

enum class OptionsStructure {
  None,
  LongCall,
  LongPut,
  CallDebitSpread,
  PutDebitSpread,
  IronCondor,
  Straddle,
  Strangle,
};

enum class OrderType {
  Market,
  Limit,
  StopLimit,
};

enum class TimeInForce {
  Gtc,
  Day,
  Ioc,
  Fok,
};

enum class EventSeverity {
  None,
  Medium,
  High,
};

enum class DataStatus {
  Ok,
  Degraded,
  Down,
};

const char* toString(AssetClass v);
const char* toString(Direction v);
const char* toString(StrategyTag v);
const char* toString(Regime v);
const char* toString(RiskMode v);
const char* toString(Permission v);
const char* toString(TrailRule v);
const char* toString(OptionsStructure v);
const char* toString(OrderType v);
const char* toString(TimeInForce v);
const char* toString(EventSeverity v);
const char* toString(DataStatus v);

std::optional<AssetClass> parseAssetClass(std::string_view s);
std::optional<Direction> parseDirection(std::string_view s);
std::optional<StrategyTag> parseStrategyTag(std::string_view s);
std::optional<Regime> parseRegime(std::string_view s);
std::optional<RiskMode> parseRiskMode(std::string_view s);
std::optional<OptionsStructure> parseOptionsStructure(std::string_view s);
std::optional<EventSeverity> parseEventSeverity(std::string_view s);
std::optional<DataStatus> parseDataStatus(std::string_view s);

// Crypto is its own correlation/trade-count universe; every other asset
// class is treated as equities by the permission matrix.
inline bool isCrypto(AssetClass a) { return a == AssetClass::Crypto; }

inline bool isTrendRegime(Regime r) {
  return r == Regime::TrendUp || r == Regime::TrendDown;
}

}  // namespace domain
}  // namespace tradegate
