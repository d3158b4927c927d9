#include "tradegate/execution/position_sizer.hpp"

#include <algorithm>
#include <cmath>

namespace tradegate {

using domain::AssetClass;

namespace {

constexpr double kKellyDamper = 0.25;

domain::PositionSizingResult zeroResult(double equity, double risk_pct,
                                        double leverage) {
  domain::PositionSizingResult r;
  r.account_equity = equity;
  r.risk_pct = risk_pct;
  r.leverage = leverage;
  return r;
}

}  // namespace

double roundToLot(double quantity, AssetClass asset_class) {
  if (!(quantity > 0.0)) return 0.0;
  switch (asset_class) {
    case AssetClass::Crypto:
      return std::floor(quantity * 10000.0) / 10000.0;
    case AssetClass::Forex:
      return std::floor(quantity / 1000.0) * 1000.0;
    case AssetClass::Equity:
    case AssetClass::Options:
    case AssetClass::Futures:
      return std::floor(quantity);
  }
  return std::floor(quantity);
}

double kellyMaxSize(double equity, double risk_pct, double win_rate,
                    double avg_win, double avg_loss) {
  if (avg_loss <= 0.0 || win_rate <= 0.0 || win_rate >= 1.0) {
    return equity * risk_pct;
  }
  const double payoff = avg_win / avg_loss;
  const double kelly = (win_rate * payoff - (1.0 - win_rate)) / payoff;
  const double dampened = std::max(0.0, kelly) * kKellyDamper;
  return equity * std::min(dampened, risk_pct);
}

PositionSizer::PositionSizer(domain::ExecutionLimits limits)
    : limits_(limits) {}

// ---- compute ----
domain::PositionSizingResult PositionSizer::compute(
    const domain::TradeIntent& intent, const SizingOptions& opts) const {
  const double equity =
      intent.account_equity.value_or(limits_.default_account_equity);
  const double risk_pct = intent.risk_pct
                              ? *intent.risk_pct
                              : opts.governor_risk_per_trade.value_or(
                                    limits_.default_risk_pct);
  const double leverage =
      opts.effective_leverage
          ? *opts.effective_leverage
          : intent.leverage.value_or(1.0);
  const double entry = intent.entry_price;

  double stop = 0.0;
  if (opts.stop_price && *opts.stop_price > 0.0) {
    stop = *opts.stop_price;
  } else if (intent.stop_price && *intent.stop_price > 0.0) {
    stop = *intent.stop_price;
  } else {
    const double mult = domain::isCrypto(intent.asset_class) ? 2.0 : 1.5;
    stop = intent.direction == domain::Direction::Long
               ? entry - intent.atr * mult
               : entry + intent.atr * mult;
  }

  const double stop_distance = std::abs(entry - stop);
  if (!(stop_distance > 0.0) || !std::isfinite(stop_distance)) {
    return zeroResult(equity, risk_pct, leverage);
  }

  const double dollar_risk = equity * risk_pct;
  double raw_qty = dollar_risk / stop_distance;

  if (opts.governor_max_position_size && *opts.governor_max_position_size > 0.0) {
    raw_qty = std::min(raw_qty, *opts.governor_max_position_size);
  }

  const double max_notional = equity * limits_.max_notional_pct * leverage;
  if (entry > 0.0 && raw_qty * entry > max_notional) {
    raw_qty = max_notional / entry;
  }

  domain::PositionSizingResult r;
  r.quantity = roundToLot(raw_qty, intent.asset_class);
  r.raw_quantity = raw_qty;
  r.risk_per_unit = stop_distance;
  r.total_risk_usd = r.quantity * stop_distance;
  r.account_equity = equity;
  r.risk_pct = risk_pct;
  r.notional_usd = r.quantity * entry;
  r.leverage = leverage;
  return r;
}

}  // namespace tradegate
