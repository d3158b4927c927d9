#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>
#include <string_view>

namespace tradegate {
namespace domain {

// Market universe used by session, cluster and trade-count rules. Only
// crypto trades around the clock; every other asset class follows the
// equity calendar.
enum class Market {
  Equities,
  Crypto,
};

// Coarse institutional flow state of the instrument.
enum class FlowState {
  Accumulation,
  Positioning,
  Launch,
  Exhaustion,
  Neutral,
};

enum class TradeArchetype {
  TrendContinuation,
  BreakoutEarly,
  BreakoutLate,
  PullbackEntry,
  MeanReversion,
  CounterTrendFade,
  ReversalConfirmed,
  MomentumAdd,
};

inline constexpr int kArchetypeCount = 8;

enum class StopStyle {
  TightStructural,
  Structural,
  AtrTrailing,
  WiderConfirmation,
};

inline Market marketFor(AssetClass a) {
  return isCrypto(a) ? Market::Crypto : Market::Equities;
}

inline bool isBreakout(TradeArchetype a) {
  return a == TradeArchetype::BreakoutEarly || a == TradeArchetype::BreakoutLate;
}

const char* toString(Market v);
const char* toString(FlowState v);
const char* toString(TradeArchetype v);
const char* toString(StopStyle v);

std::optional<Market> parseMarket(std::string_view s);
std::optional<FlowState> parseFlowState(std::string_view s);
std::optional<TradeArchetype> parseTradeArchetype(std::string_view s);

}  // namespace domain
}  // namespace tradegate
