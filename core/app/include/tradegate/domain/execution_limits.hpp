#pragma once

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionLimits — execution-layer hard limits and sizing defaults
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the thresholds used by ExecutionGovernor,
//         PositionSizer and ExecutionPipeline.
//
// @details
// All percentages are fractions of account equity (0.02 == 2%).
//
// Loaded from the "execution" object of the engine config file
// (see config/engine_config.hpp); any key absent from the file keeps the
// default below. Copied by value into each component at construction.
//
// Thread model:
//   Plain data struct with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct ExecutionLimits {
  /// Realised daily loss at or above this fraction blocks new trades.
  double max_daily_loss_pct{0.02};

  /// Total open risk at or above this fraction blocks new trades.
  double max_portfolio_heat_pct{0.06};

  /// Minimum reward:risk at TP1.
  double min_required_rr{1.5};

  /// Open trade count at or above this value blocks new trades.
  int max_open_trades{8};

  /// Per-trade risk strictly above this fraction blocks the trade.
  double max_single_trade_risk_pct{0.02};

  /// Equity used when the account store has none.
  double default_account_equity{100000.0};

  /// Risk per trade when neither the intent nor the governor supplies one.
  double default_risk_pct{0.0075};

  /// A single position's notional may not exceed this fraction of
  /// equity times leverage.
  double max_notional_pct{0.25};

  /// Smallest tradable crypto quantity (also the lot step).
  double min_crypto_quantity{0.0001};
};

}  // namespace domain
}  // namespace tradegate
