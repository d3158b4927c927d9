#include "tradegate/flow/session_overlay.hpp"

#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace tradegate {

using domain::Market;
using domain::StopStyle;

const char* toString(SessionPhase p) {
  switch (p) {
    case SessionPhase::PreMarket: return "PRE_MARKET";
    case SessionPhase::OpeningRange: return "OPENING_RANGE";
    case SessionPhase::MorningSession: return "MORNING_SESSION";
    case SessionPhase::Midday: return "MIDDAY";
    case SessionPhase::PowerHour: return "POWER_HOUR";
    case SessionPhase::CloseAuction: return "CLOSE_AUCTION";
    case SessionPhase::AfterHours: return "AFTER_HOURS";
    case SessionPhase::CryptoAsian: return "CRYPTO_ASIAN";
    case SessionPhase::CryptoEuropean: return "CRYPTO_EUROPEAN";
    case SessionPhase::CryptoUs: return "CRYPTO_US";
    case SessionPhase::CryptoOvernight: return "CRYPTO_OVERNIGHT";
    case SessionPhase::Unknown: return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::optional<SessionPhase> parseSessionPhase(std::string_view s) {
  std::string upper(s);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (int i = 0; i <= static_cast<int>(SessionPhase::Unknown); ++i) {
    const auto p = static_cast<SessionPhase>(i);
    if (upper == toString(p)) return p;
  }
  return std::nullopt;
}

// ---- detectSessionPhase ----
SessionPhase detectSessionPhase(Market market, std::int64_t epoch_ms) {
  if (market == Market::Crypto) {
    const int h = utc_hour(epoch_ms);
    if (h < 8) return SessionPhase::CryptoAsian;
    if (h < 14) return SessionPhase::CryptoEuropean;
    if (h < 22) return SessionPhase::CryptoUs;
    return SessionPhase::CryptoOvernight;
  }

  const int et = eastern_minute_of_day(epoch_ms);
  if (et < 9 * 60 + 30) return SessionPhase::PreMarket;
  if (et < 10 * 60) return SessionPhase::OpeningRange;
  if (et < 11 * 60 + 30) return SessionPhase::MorningSession;
  if (et < 14 * 60) return SessionPhase::Midday;
  if (et < 15 * 60 + 50) return SessionPhase::PowerHour;
  if (et < 16 * 60) return SessionPhase::CloseAuction;
  return SessionPhase::AfterHours;
}

namespace {

bool belongsTo(SessionPhase phase, Market market) {
  switch (phase) {
    case SessionPhase::CryptoAsian:
    case SessionPhase::CryptoEuropean:
    case SessionPhase::CryptoUs:
    case SessionPhase::CryptoOvernight:
      return market == Market::Crypto;
    case SessionPhase::Unknown:
      return false;
    default:
      return market == Market::Equities;
  }
}

SessionOverlay makeOverlay(SessionPhase phase, Market market, double tps_adj,
                           double size_cap, double ru_cap, double min_tps,
                           double slippage, bool restrictive,
                           std::string reason) {
  SessionOverlay o;
  o.phase = phase;
  o.market = market;
  o.tps_adjustment = tps_adj;
  o.size_multiplier_cap = size_cap;
  o.ru_cap_multiplier = ru_cap;
  o.minimum_tps = min_tps;
  o.slippage_multiplier = slippage;
  o.restrictive = restrictive;
  o.reason = std::move(reason);
  return o;
}

}  // namespace

// ---- sessionOverlayForPhase: static per-phase table ----
SessionOverlay sessionOverlayForPhase(SessionPhase phase, Market market) {
  if (!belongsTo(phase, market)) {
    return makeOverlay(SessionPhase::Unknown, market, 0.0, 0.8, 0.8, 65.0, 1.2,
                       false,
                       "UNKNOWN session, applying conservative defaults.");
  }

  SessionOverlay o;
  switch (phase) {
    case SessionPhase::OpeningRange:
      o = makeOverlay(phase, market, 5.0, 1.0, 1.0, 60.0, 1.0, false,
                      "OPENING_RANGE: ORB/trend-continuation window. Tighter "
                      "stops, block mean reversion.");
      o.session_allowed = {"ORB (Opening Range Breakout)",
                           "Trend continuation off gap",
                           "Momentum entries off opening drive"};
      o.session_blocked = {"Mean reversion / fading the open",
                           "Counter-trend scalps in first 15 min"};
      o.stop_style_override = StopStyle::TightStructural;
      break;

    case SessionPhase::MorningSession:
      o = makeOverlay(phase, market, 0.0, 1.0, 1.0, 65.0, 1.0, false,
                      "MORNING_SESSION: Full institutional flow. Standard "
                      "permissions.");
      break;

    case SessionPhase::Midday:
      o = makeOverlay(phase, market, -5.0, 0.70, 0.70, 70.0, 1.3, true,
                      "MIDDAY: Low volume chop zone. Prefer mean reversion, "
                      "block momentum.");
      o.session_allowed = {"Mean reversion to VWAP",
                           "Range-bound scalps between support/resistance"};
      o.session_blocked = {
          "Momentum continuation (midday breakouts frequently fail)",
          "Aggressive breakout entries (wait for power hour)"};
      break;

    case SessionPhase::PowerHour:
      o = makeOverlay(phase, market, 0.0, 1.0, 1.0, 65.0, 1.0, false,
                      "POWER_HOUR: Renewed institutional flow. Standard+ "
                      "permissions.");
      o.session_allowed = {"Momentum continuation into close",
                           "Late-day breakouts with volume confirmation"};
      break;

    case SessionPhase::CloseAuction:
      o = makeOverlay(phase, market, -10.0, 0.5, 0.5, 80.0, 1.15, true,
                      "CLOSE_AUCTION: Last minutes, tighten or block. Gap "
                      "risk high.");
      o.session_allowed = {"Exit/trim existing positions"};
      o.session_blocked = {"New entries without A+ confidence",
                           "Breakout entries (gap risk overnight)",
                           "Mean reversion (closing auction sweep risk)"};
      o.stop_style_override = StopStyle::TightStructural;
      o.minimum_confidence = 75.0;
      o.minimum_liquidity_clarity = 70.0;
      break;

    case SessionPhase::PreMarket:
      o = makeOverlay(phase, market, -8.0, 0.5, 0.5, 75.0, 1.8, true,
                      "PRE_MARKET: Thin books, wide spreads. ALLOW_TIGHTENED, "
                      "limit orders only.");
      o.session_allowed = {"Limit orders only (ALLOW_TIGHTENED)",
                           "Gap analysis prep entries"};
      o.session_blocked = {"Market orders (slippage too high)",
                           "Scalping (spreads too wide)",
                           "Large position sizing"};
      o.stop_style_override = StopStyle::WiderConfirmation;
      o.minimum_confidence = 60.0;
      o.minimum_liquidity_clarity = 50.0;
      break;

    case SessionPhase::AfterHours:
      o = makeOverlay(phase, market, -12.0, 0.40, 0.35, 78.0, 2.5, true,
                      "AFTER_HOURS: Very thin liquidity. ALLOW_TIGHTENED, "
                      "minimal sizing.");
      o.session_allowed = {"Limit orders only (ALLOW_TIGHTENED)",
                           "Earnings reaction entries (if catalyst)"};
      o.session_blocked = {"Market orders", "Scalping",
                           "Large position sizing", "Counter-trend fades"};
      o.stop_style_override = StopStyle::WiderConfirmation;
      o.minimum_confidence = 65.0;
      o.minimum_liquidity_clarity = 55.0;
      break;

    case SessionPhase::CryptoUs:
      o = makeOverlay(phase, market, 3.0, 1.0, 1.0, 60.0, 1.0, false,
                      "CRYPTO_US: NY overlap, peak crypto liquidity. "
                      "Momentum/continuation permitted.");
      o.session_allowed = {"Momentum continuation, peak liquidity window",
                           "Breakout entries with volume confirmation",
                           "Trend-following on funded pairs"};
      break;

    case SessionPhase::CryptoEuropean:
      o = makeOverlay(phase, market, 0.0, 0.9, 0.9, 65.0, 1.1, false,
                      "CRYPTO_EUROPEAN: Improving depth. Standard "
                      "permissions.");
      o.session_allowed = {"Range breakout entries",
                           "Early trend confirmation"};
      break;

    case SessionPhase::CryptoAsian:
      o = makeOverlay(phase, market, -3.0, 0.75, 0.75, 68.0, 1.2, true,
                      "CRYPTO_ASIAN: Moderate depth. Tighten RU, avoid "
                      "illiquid alts.");
      o.session_allowed = {"BTC/ETH pairs (liquid enough)",
                           "Mean reversion setups"};
      o.session_blocked = {"Low-cap alt breakouts (too thin)",
                           "Aggressive momentum on illiquid pairs"};
      o.minimum_liquidity_clarity = 50.0;
      break;

    case SessionPhase::CryptoOvernight:
      o = makeOverlay(phase, market, -8.0, 0.55, 0.55, 75.0, 1.6, true,
                      "CRYPTO_OVERNIGHT: Thin window. Tighten RU, require "
                      "higher liquidity clarity.");
      o.session_allowed = {"BTC/ETH limit orders only"};
      o.session_blocked = {"Alt-coin entries (insufficient depth)",
                           "Market orders on any pair",
                           "Aggressive momentum plays"};
      o.stop_style_override = StopStyle::WiderConfirmation;
      o.minimum_confidence = 55.0;
      o.minimum_liquidity_clarity = 60.0;
      break;

    case SessionPhase::Unknown:
      break;
  }
  return o;
}

}  // namespace tradegate
