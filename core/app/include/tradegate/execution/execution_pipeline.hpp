#pragma once

#include "tradegate/domain/exit_plan.hpp"
#include "tradegate/domain/governor_decision.hpp"
#include "tradegate/domain/leverage_result.hpp"
#include "tradegate/domain/position_sizing_result.hpp"
#include "tradegate/domain/trade_intent.hpp"
#include "tradegate/execution/position_sizer.hpp"
#include "tradegate/market/i_account_store.hpp"
#include "tradegate/market/i_atr_source.hpp"
#include "tradegate/risk/execution_governor.hpp"
#include "tradegate/risk/permission_matrix.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tradegate {

// Request as it arrives from signal producers. Regime and strategy are free
// text mapped through fixed tables.
struct PipelineInput {
  std::string account_id;
  std::string symbol;
  domain::Direction side{domain::Direction::Long};
  double entry_price{0.0};
  // "crypto", "equity", "forex" or "commodity" (sized as equity).
  std::string asset_class{"equity"};
  double confidence{50.0};
  std::string regime{"RANGE_NEUTRAL"};
  std::string strategy_tag{"alert_intelligence"};
  // Pre-fetched ATR; the source is asked when absent or not positive.
  std::optional<double> atr;
  bool guard_enabled{true};
  // Session state for the permission snapshot. Defaults apply when absent;
  // guard_enabled and the mapped regime always override.
  std::optional<SnapshotInput> session;
};

struct EntryRiskMetrics {
  double normalized_r{0.0};  // 1% of equity
  double dynamic_r{0.0};     // equity * risk per trade
  double risk_per_trade_at_entry{0.0};
  double equity_at_entry{0.0};
};

struct PipelineResult {
  domain::ExitPlan exits;
  domain::PositionSizingResult sizing;
  domain::LeverageResult leverage;
  domain::GovernorDecision governor;
  double atr{0.0};
  EntryRiskMetrics entry_risk;
  std::string trade_type;  // "Spot" or "Margin"
  double account_equity{0.0};
  domain::TradeIntent intent;
  domain::Regime engine_regime{domain::Regime::RangeNeutral};
  domain::StrategyTag engine_strategy{domain::StrategyTag::TrendPullback};
};

enum class FailureCode {
  NoAtr,
  BadExits,
  RiskLocked,
  GovernorBlock,
};

const char* toString(FailureCode c);

struct PipelineFailure {
  FailureCode code{FailureCode::NoAtr};
  std::string reason;
  // Populated for GOVERNOR_BLOCK.
  std::vector<std::string> reason_codes;
  std::vector<std::string> required_actions;
};

using PipelineOutcome = std::variant<PipelineResult, PipelineFailure>;

// Free-text label -> engine enum. Unknown labels map to RANGE_NEUTRAL and
// TREND_PULLBACK respectively; matching is case-insensitive.
domain::Regime mapPipelineRegime(std::string_view label);
domain::StrategyTag mapPipelineStrategy(std::string_view label);
domain::AssetClass mapPipelineAssetClass(std::string_view label);

// Governor exposure from the account store. Only realised losses count
// toward the daily figure; heat is open risk over equity.
ExposureState accountExposure(const IAccountStore& accounts,
                              const std::string& account_id, double equity,
                              std::optional<PermissionSnapshot> snapshot);

// -----------------------------------------------------------------------------
// ExecutionPipeline — orchestrator for auto-created trades
// -----------------------------------------------------------------------------
//
// @brief  Resolves ATR and account state, then runs exits, governor,
//         leverage and sizing, stopping at the first hard failure.
//
// @details
// Stages (each failure short-circuits and is logged to std::cerr):
//
//   1. ATR           input value if positive, else IAtrSource   -> NO_ATR
//   2. equity        IAccountStore, else the configured default
//   3. intent        built from the mapped labels and the store's open
//                    positions
//   4. exit plan     stop and TP1 finite and > 0, rr_at_tp1 >= 1 -> BAD_EXITS
//   5. snapshot      risk mode LOCKED                             -> RISK_LOCKED
//   6. governor      daily loss (losses only), heat and open count
//                    from the store                               -> GOVERNOR_BLOCK
//   7. leverage      from the governor's risk mode and ATR%
//   8. sizing        governor risk per trade, max size, leverage
//   9. entry risk    normalized R, dynamic R
//
// Nothing is retried. Collaborator calls run sequentially on the calling
// thread.
//
// Thread model:
//   run() is const. Concurrency safety comes from the collaborators.
// -----------------------------------------------------------------------------
class ExecutionPipeline {
 public:
  ExecutionPipeline(IAtrSource& atr_source, const IAccountStore& accounts,
                    const ExecutionGovernor& governor);

  ExecutionPipeline(const ExecutionPipeline&) = delete;
  ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

  PipelineOutcome run(const PipelineInput& input) const;

 private:
  PipelineFailure fail(FailureCode code, const std::string& symbol,
                       std::string reason) const;

  IAtrSource& atr_source_;
  const IAccountStore& accounts_;
  const ExecutionGovernor& governor_;
  PositionSizer sizer_;
};

}  // namespace tradegate
