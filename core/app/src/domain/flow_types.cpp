#include "tradegate/domain/flow_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tradegate {
namespace domain {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

const char* toString(Market v) {
  switch (v) {
    case Market::Equities: return "equities";
    case Market::Crypto:   return "crypto";
  }
  return "equities";
}

const char* toString(FlowState v) {
  switch (v) {
    case FlowState::Accumulation: return "ACCUMULATION";
    case FlowState::Positioning:  return "POSITIONING";
    case FlowState::Launch:       return "LAUNCH";
    case FlowState::Exhaustion:   return "EXHAUSTION";
    case FlowState::Neutral:      return "NEUTRAL";
  }
  return "NEUTRAL";
}

const char* toString(TradeArchetype v) {
  switch (v) {
    case TradeArchetype::TrendContinuation: return "trend_continuation";
    case TradeArchetype::BreakoutEarly:     return "breakout_early";
    case TradeArchetype::BreakoutLate:      return "breakout_late";
    case TradeArchetype::PullbackEntry:     return "pullback_entry";
    case TradeArchetype::MeanReversion:     return "mean_reversion";
    case TradeArchetype::CounterTrendFade:  return "counter_trend_fade";
    case TradeArchetype::ReversalConfirmed: return "reversal_confirmed";
    case TradeArchetype::MomentumAdd:       return "momentum_add";
  }
  return "unknown";
}

const char* toString(StopStyle v) {
  switch (v) {
    case StopStyle::TightStructural:   return "tight_structural";
    case StopStyle::Structural:        return "structural";
    case StopStyle::AtrTrailing:       return "atr_trailing";
    case StopStyle::WiderConfirmation: return "wider_confirmation";
  }
  return "structural";
}

std::optional<Market> parseMarket(std::string_view s) {
  const auto l = lower(s);
  if (l == "equities" || l == "equity") return Market::Equities;
  if (l == "crypto") return Market::Crypto;
  return std::nullopt;
}

std::optional<FlowState> parseFlowState(std::string_view s) {
  const auto l = lower(s);
  if (l == "accumulation") return FlowState::Accumulation;
  if (l == "positioning") return FlowState::Positioning;
  if (l == "launch") return FlowState::Launch;
  if (l == "exhaustion") return FlowState::Exhaustion;
  if (l == "neutral") return FlowState::Neutral;
  return std::nullopt;
}

std::optional<TradeArchetype> parseTradeArchetype(std::string_view s) {
  const auto l = lower(s);
  if (l == "trend_continuation") return TradeArchetype::TrendContinuation;
  if (l == "breakout_early") return TradeArchetype::BreakoutEarly;
  if (l == "breakout_late") return TradeArchetype::BreakoutLate;
  if (l == "pullback_entry") return TradeArchetype::PullbackEntry;
  if (l == "mean_reversion") return TradeArchetype::MeanReversion;
  if (l == "counter_trend_fade") return TradeArchetype::CounterTrendFade;
  if (l == "reversal_confirmed") return TradeArchetype::ReversalConfirmed;
  if (l == "momentum_add") return TradeArchetype::MomentumAdd;
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradegate
