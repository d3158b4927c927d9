#pragma once

#include "tradegate/domain/flow_types.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Session phases and their permission overlays
// -----------------------------------------------------------------------------
//
// @brief  Classifies a timestamp into a trading-session phase and returns the
//         fixed overlay that FlowTradePermission layers over its verdict.
//
// @details
//   Equities (Eastern, fixed UTC-5):
//     PRE_MARKET      < 09:30
//     OPENING_RANGE   < 10:00
//     MORNING_SESSION < 11:30
//     MIDDAY          < 14:00
//     POWER_HOUR      < 15:50
//     CLOSE_AUCTION   < 16:00
//     AFTER_HOURS     otherwise
//
//   Crypto (UTC hour):
//     CRYPTO_ASIAN 0-8, CRYPTO_EUROPEAN 8-14, CRYPTO_US 14-22,
//     CRYPTO_OVERNIGHT 22-24
//
// A phase that does not belong to the requested market (or UNKNOWN) maps to
// the conservative default overlay.
// -----------------------------------------------------------------------------

enum class SessionPhase {
  PreMarket,
  OpeningRange,
  MorningSession,
  Midday,
  PowerHour,
  CloseAuction,
  AfterHours,
  CryptoAsian,
  CryptoEuropean,
  CryptoUs,
  CryptoOvernight,
  Unknown,
};

const char* toString(SessionPhase p);
std::optional<SessionPhase> parseSessionPhase(std::string_view s);

struct SessionOverlay {
  SessionPhase phase{SessionPhase::Unknown};
  domain::Market market{domain::Market::Equities};

  // Added to TPS on the 0-100 scale.
  double tps_adjustment{0.0};
  double size_multiplier_cap{0.8};
  double ru_cap_multiplier{0.8};

  std::vector<std::string> session_allowed;
  std::vector<std::string> session_blocked;
  std::optional<domain::StopStyle> stop_style_override;

  // 0 disables the gate.
  double minimum_confidence{0.0};
  double minimum_liquidity_clarity{0.0};
  double minimum_tps{65.0};

  double slippage_multiplier{1.2};
  std::string reason;
  bool restrictive{false};
};

SessionPhase detectSessionPhase(domain::Market market, std::int64_t epoch_ms);

SessionOverlay sessionOverlayForPhase(SessionPhase phase, domain::Market market);

// Phase at the provider's current time.
inline SessionOverlay currentSessionOverlay(domain::Market market,
                                            const ITimeProvider& clock) {
  return sessionOverlayForPhase(detectSessionPhase(market, clock.now_ms()),
                                market);
}

}  // namespace tradegate
