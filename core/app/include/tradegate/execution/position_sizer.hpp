#pragma once

#include "tradegate/domain/execution_limits.hpp"
#include "tradegate/domain/position_sizing_result.hpp"
#include "tradegate/domain/trade_intent.hpp"

#include <optional>

namespace tradegate {

// Upstream values that constrain sizing. Any field left empty falls back to
// the intent, then to ExecutionLimits.
struct SizingOptions {
  std::optional<double> governor_risk_per_trade;
  std::optional<double> governor_max_position_size;
  std::optional<double> effective_leverage;
  // Final stop from the exit plan; preferred over the intent's stop.
  std::optional<double> stop_price;
};

// -----------------------------------------------------------------------------
// PositionSizer — fixed-fractional sizing with notional cap and lot rounding
// -----------------------------------------------------------------------------
//
// @brief  quantity = equity * risk_pct / |entry - stop|, then capped and
//         rounded.
//
// @details
// Steps:
//   1. equity   = intent.account_equity or limits.default_account_equity
//      risk_pct = intent.risk_pct, governor risk per trade, or default
//      leverage = effective_leverage, intent.leverage, or 1
//   2. stop     = options.stop_price, intent.stop_price, or entry -/+ ATR *
//                 (2.0 crypto, 1.5 otherwise)
//   3. raw qty  = equity * risk_pct / stop distance
//   4. capped by a positive governor max position size
//   5. capped so qty * entry <= equity * max_notional_pct * leverage
//   6. lot-rounded down: whole units (equity, options, futures), 4 decimals
//      (crypto), 1000-unit lots (forex)
//
// Rounding is always downward and there is no minimum quantity, so both
// total_risk_usd <= equity * risk_pct and notional_usd <= the cap hold for
// every positive stop distance. A quantity that rounds to 0 is reported as
// ZERO_SIZE by validateProposal.
//
// A non-positive stop distance yields an all-zero result.
//
// Thread model: const and reentrant.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(domain::ExecutionLimits limits = {});

  domain::PositionSizingResult compute(const domain::TradeIntent& intent,
                                       const SizingOptions& opts = {}) const;

 private:
  domain::ExecutionLimits limits_;
};

// Rounds down to the asset class's lot size; <= 0 maps to 0.
double roundToLot(double quantity, domain::AssetClass asset_class);

// Quarter-Kelly dollar ceiling: equity * min(0.25 * max(0, f*), risk_pct)
// with f* = (p * b - (1 - p)) / b and b = avg_win / avg_loss. Degenerate
// inputs (avg_loss <= 0, p outside (0, 1)) return equity * risk_pct.
// Advisory only; compute() never applies it.
double kellyMaxSize(double equity, double risk_pct, double win_rate,
                    double avg_win, double avg_loss);

}  // namespace tradegate
