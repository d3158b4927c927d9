#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace domain {

// An open position as reported by the account store. Only the fields the
// correlation checks need.
struct OpenPosition {
  std::string symbol;
  Direction direction{Direction::Long};
  AssetClass asset_class{AssetClass::Equity};
};

// -----------------------------------------------------------------------------
// TradeIntent — what the caller wants to do
// -----------------------------------------------------------------------------
//
// @brief  Immutable description of a proposed trade for a single evaluation.
//
// @details
// Built once by the caller (or by ExecutionPipeline from a PipelineInput)
// and passed by const reference through every stage. No stage mutates it;
// stages that need resolved values (equity, stop) return them in their own
// result records.
//
// Optional fields:
//   stop_price      — explicit stop; otherwise derived from ATR.
//   account_equity  — explicit equity; otherwise the configured default.
//   risk_pct        — fraction of equity to risk (0.0075 == 0.75%);
//                     otherwise the governor's risk-per-trade.
//   leverage        — explicit leverage override, honoured by
//                     LeverageSelector within the asset-class cap.
//   options_*       — forced options structure / DTE / delta.
// -----------------------------------------------------------------------------
struct TradeIntent {
  std::string symbol;
  AssetClass asset_class{AssetClass::Equity};
  Direction direction{Direction::Long};
  StrategyTag strategy_tag{StrategyTag::TrendPullback};
  double confidence{50.0};  // 0-100
  Regime regime{Regime::RangeNeutral};
  double entry_price{0.0};
  double atr{0.0};
  std::optional<double> stop_price;
  EventSeverity event_severity{EventSeverity::None};

  std::optional<int> options_dte;
  std::optional<double> options_delta;
  std::optional<OptionsStructure> options_structure;

  std::optional<double> account_equity;
  std::optional<double> risk_pct;
  std::optional<double> leverage;

  std::vector<OpenPosition> open_positions;
};

}  // namespace domain
}  // namespace tradegate
