#include "tradegate/domain/market_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tradegate {
namespace domain {

namespace {

std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

// ---- toString overloads ----

const char* toString(AssetClass v) {
  switch (v) {
    case AssetClass::Equity:  return "equity";
    case AssetClass::Crypto:  return "crypto";
    case AssetClass::Futures: return "futures";
    case AssetClass::Forex:   return "forex";
    case AssetClass::Options: return "options";
  }
  return "unknown";
}

const char* toString(Direction v) {
  switch (v) {
    case Direction::Long:  return "LONG";
    case Direction::Short: return "SHORT";
  }
  return "UNKNOWN";
}

const char* toString(StrategyTag v) {
  switch (v) {
    case StrategyTag::TrendPullback:        return "TREND_PULLBACK";
    case StrategyTag::BreakoutContinuation: return "BREAKOUT_CONTINUATION";
    case StrategyTag::MeanReversion:        return "MEAN_REVERSION";
    case StrategyTag::RangeFade:            return "RANGE_FADE";
    case StrategyTag::MomentumReversal:     return "MOMENTUM_REVERSAL";
    case StrategyTag::EventStrategy:        return "EVENT_STRATEGY";
  }
  return "UNKNOWN";
}

const char* toString(Regime v) {
  switch (v) {
    case Regime::TrendUp:        return "TREND_UP";
    case Regime::TrendDown:      return "TREND_DOWN";
    case Regime::RangeNeutral:   return "RANGE_NEUTRAL";
    case Regime::VolExpansion:   return "VOL_EXPANSION";
    case Regime::VolContraction: return "VOL_CONTRACTION";
    case Regime::RiskOffStress:  return "RISK_OFF_STRESS";
  }
  return "UNKNOWN";
}

const char* toString(RiskMode v) {
  switch (v) {
    case RiskMode::Normal:    return "NORMAL";
    case RiskMode::Throttled: return "THROTTLED";
    case RiskMode::Defensive: return "DEFENSIVE";
    case RiskMode::Locked:    return "LOCKED";
  }
  return "UNKNOWN";
}

const char* toString(Permission v) {
  switch (v) {
    case Permission::Allow:          return "ALLOW";
    case Permission::AllowReduced:   return "ALLOW_REDUCED";
    case Permission::AllowTightened: return "ALLOW_TIGHTENED";
    case Permission::Block:          return "BLOCK";
  }
  return "UNKNOWN";
}

const char* toString(TrailRule v) {
  switch (v) {
    case TrailRule::None:             return "NONE";
    case TrailRule::Atr1x:            return "ATR_1X";
    case TrailRule::Atr1_5x:          return "ATR_1_5X";
    case TrailRule::Atr2x:            return "ATR_2X";
    case TrailRule::BreakevenAfter1R: return "BREAKEVEN_AFTER_1R";
    case TrailRule::Chandelier:       return "CHANDELIER";
    case TrailRule::PercentTrail:     return "PERCENT_TRAIL";
  }
  return "UNKNOWN";
}

const char* toString(OptionsStructure v) {
  switch (v) {
    case OptionsStructure::None:            return "NONE";
    case OptionsStructure::LongCall:        return "LONG_CALL";
    case OptionsStructure::LongPut:         return "LONG_PUT";
    case OptionsStructure::CallDebitSpread: return "CALL_DEBIT_SPREAD";
    case OptionsStructure::PutDebitSpread:  return "PUT_DEBIT_SPREAD";
    case OptionsStructure::IronCondor:      return "IRON_CONDOR";
    case OptionsStructure::Straddle:        return "STRADDLE";
    case OptionsStructure::Strangle:        return "STRANGLE";
  }
  return "UNKNOWN";
}

const char* toString(OrderType v) {
  switch (v) {
    case OrderType::Market:    return "MARKET";
    case OrderType::Limit:     return "LIMIT";
    case OrderType::StopLimit: return "STOP_LIMIT";
  }
  return "UNKNOWN";
}

const char* toString(TimeInForce v) {
  switch (v) {
    case TimeInForce::Gtc: return "GTC";
    case TimeInForce::Day: return "DAY";
    case TimeInForce::Ioc: return "IOC";
    case TimeInForce::Fok: return "FOK";
  }
  return "UNKNOWN";
}

const char* toString(EventSeverity v) {
  switch (v) {
    case EventSeverity::None:   return "none";
    case EventSeverity::Medium: return "medium";
    case EventSeverity::High:   return "high";
  }
  return "unknown";
}

const char* toString(DataStatus v) {
  switch (v) {
    case DataStatus::Ok:       return "OK";
    case DataStatus::Degraded: return "DEGRADED";
    case DataStatus::Down:     return "DOWN";
  }
  return "UNKNOWN";
}

// ---- parse functions: case-insensitive match on the wire string ----

std::optional<AssetClass> parseAssetClass(std::string_view s) {
  const auto u = upper(s);
  if (u == "EQUITY" || u == "EQUITIES") return AssetClass::Equity;
  if (u == "CRYPTO") return AssetClass::Crypto;
  if (u == "FUTURES") return AssetClass::Futures;
  if (u == "FOREX") return AssetClass::Forex;
  if (u == "OPTIONS") return AssetClass::Options;
  return std::nullopt;
}

std::optional<Direction> parseDirection(std::string_view s) {
  const auto u = upper(s);
  if (u == "LONG") return Direction::Long;
  if (u == "SHORT") return Direction::Short;
  return std::nullopt;
}

std::optional<StrategyTag> parseStrategyTag(std::string_view s) {
  const auto u = upper(s);
  if (u == "TREND_PULLBACK") return StrategyTag::TrendPullback;
  if (u == "BREAKOUT_CONTINUATION") return StrategyTag::BreakoutContinuation;
  if (u == "MEAN_REVERSION") return StrategyTag::MeanReversion;
  if (u == "RANGE_FADE") return StrategyTag::RangeFade;
  if (u == "MOMENTUM_REVERSAL") return StrategyTag::MomentumReversal;
  if (u == "EVENT_STRATEGY") return StrategyTag::EventStrategy;
  return std::nullopt;
}

std::optional<Regime> parseRegime(std::string_view s) {
  const auto u = upper(s);
  if (u == "TREND_UP") return Regime::TrendUp;
  if (u == "TREND_DOWN") return Regime::TrendDown;
  if (u == "RANGE_NEUTRAL") return Regime::RangeNeutral;
  if (u == "VOL_EXPANSION") return Regime::VolExpansion;
  if (u == "VOL_CONTRACTION") return Regime::VolContraction;
  if (u == "RISK_OFF_STRESS") return Regime::RiskOffStress;
  return std::nullopt;
}

std::optional<RiskMode> parseRiskMode(std::string_view s) {
  const auto u = upper(s);
  if (u == "NORMAL") return RiskMode::Normal;
  if (u == "THROTTLED") return RiskMode::Throttled;
  if (u == "DEFENSIVE") return RiskMode::Defensive;
  if (u == "LOCKED") return RiskMode::Locked;
  return std::nullopt;
}

std::optional<OptionsStructure> parseOptionsStructure(std::string_view s) {
  const auto u = upper(s);
  if (u == "NONE") return OptionsStructure::None;
  if (u == "LONG_CALL") return OptionsStructure::LongCall;
  if (u == "LONG_PUT") return OptionsStructure::LongPut;
  if (u == "CALL_DEBIT_SPREAD") return OptionsStructure::CallDebitSpread;
  if (u == "PUT_DEBIT_SPREAD") return OptionsStructure::PutDebitSpread;
  if (u == "IRON_CONDOR") return OptionsStructure::IronCondor;
  if (u == "STRADDLE") return OptionsStructure::Straddle;
  if (u == "STRANGLE") return OptionsStructure::Strangle;
  return std::nullopt;
}

std::optional<EventSeverity> parseEventSeverity(std::string_view s) {
  const auto u = upper(s);
  if (u == "NONE") return EventSeverity::None;
  if (u == "MEDIUM") return EventSeverity::Medium;
  if (u == "HIGH") return EventSeverity::High;
  return std::nullopt;
}

std::optional<DataStatus> parseDataStatus(std::string_view s) {
  const auto u = upper(s);
  if (u == "OK") return DataStatus::Ok;
  if (u == "DEGRADED") return DataStatus::Degraded;
  if (u == "DOWN") return DataStatus::Down;
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradegate
