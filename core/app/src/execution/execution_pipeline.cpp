#include "tradegate/execution/execution_pipeline.hpp"

#include "tradegate/execution/exit_plan_builder.hpp"
#include "tradegate/execution/leverage_selector.hpp"
#include "tradegate/risk/reason_codes.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace tradegate {

using domain::AssetClass;
using domain::Regime;
using domain::StrategyTag;

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

const std::unordered_map<std::string, Regime>& regimeLabels() {
  static const std::unordered_map<std::string, Regime> kMap = {
      {"trend", Regime::TrendUp},
      {"trend up", Regime::TrendUp},
      {"trend_up", Regime::TrendUp},
      {"bullish", Regime::TrendUp},
      {"trend down", Regime::TrendDown},
      {"trend_down", Regime::TrendDown},
      {"bearish", Regime::TrendDown},
      {"range", Regime::RangeNeutral},
      {"range_neutral", Regime::RangeNeutral},
      {"neutral", Regime::RangeNeutral},
      {"volatility expansion", Regime::VolExpansion},
      {"vol_expansion", Regime::VolExpansion},
      {"volatility contraction", Regime::VolContraction},
      {"vol_contraction", Regime::VolContraction},
      {"risk off", Regime::RiskOffStress},
      {"risk_off_stress", Regime::RiskOffStress},
      {"defensive", Regime::RiskOffStress},
  };
  return kMap;
}

const std::unordered_map<std::string, StrategyTag>& strategyLabels() {
  static const std::unordered_map<std::string, StrategyTag> kMap = {
      {"scanner_signal", StrategyTag::TrendPullback},
      {"strategy_signal", StrategyTag::BreakoutContinuation},
      {"alert_intelligence", StrategyTag::MomentumReversal},
      {"confluence_scan", StrategyTag::TrendPullback},
      {"focus_plan", StrategyTag::TrendPullback},
      {"operator_signal", StrategyTag::BreakoutContinuation},
  };
  return kMap;
}

std::string fmt(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

}  // namespace

const char* toString(FailureCode c) {
  switch (c) {
    case FailureCode::NoAtr: return reason::kNoAtr;
    case FailureCode::BadExits: return reason::kBadExits;
    case FailureCode::RiskLocked: return reason::kRiskLocked;
    case FailureCode::GovernorBlock: return reason::kGovernorBlock;
  }
  return "UNKNOWN";
}

Regime mapPipelineRegime(std::string_view label) {
  const auto& m = regimeLabels();
  const auto it = m.find(lower(label));
  return it == m.end() ? Regime::RangeNeutral : it->second;
}

StrategyTag mapPipelineStrategy(std::string_view label) {
  const auto& m = strategyLabels();
  const auto it = m.find(lower(label));
  return it == m.end() ? StrategyTag::TrendPullback : it->second;
}

AssetClass mapPipelineAssetClass(std::string_view label) {
  if (lower(label) == "commodity") return AssetClass::Equity;
  return domain::parseAssetClass(label).value_or(AssetClass::Equity);
}

ExposureState accountExposure(const IAccountStore& accounts,
                              const std::string& account_id, double equity,
                              std::optional<PermissionSnapshot> snapshot) {
  const double daily_pnl = accounts.daily_realized_pnl(account_id);
  ExposureState e;
  e.snapshot = std::move(snapshot);
  e.daily_loss_pct =
      equity > 0.0 && daily_pnl < 0.0 ? -daily_pnl / equity : 0.0;
  e.portfolio_heat_pct =
      equity > 0.0 ? accounts.open_risk_total(account_id) / equity : 0.0;
  e.open_trade_count =
      static_cast<int>(accounts.open_positions(account_id).size());
  return e;
}

ExecutionPipeline::ExecutionPipeline(IAtrSource& atr_source,
                                     const IAccountStore& accounts,
                                     const ExecutionGovernor& governor)
    : atr_source_(atr_source),
      accounts_(accounts),
      governor_(governor),
      sizer_(governor.limits()) {}

PipelineFailure ExecutionPipeline::fail(FailureCode code,
                                        const std::string& symbol,
                                        std::string reason) const {
  std::cerr << "[ExecutionPipeline] " << toString(code) << " for " << symbol
            << ": " << reason << "\n";
  PipelineFailure f;
  f.code = code;
  f.reason = std::move(reason);
  return f;
}

// ---- run ----
PipelineOutcome ExecutionPipeline::run(const PipelineInput& input) const {
  const domain::ExecutionLimits& limits = governor_.limits();
  const AssetClass asset_class = mapPipelineAssetClass(input.asset_class);
  const Regime regime = mapPipelineRegime(input.regime);
  const StrategyTag strategy = mapPipelineStrategy(input.strategy_tag);

  // 1. ATR
  double atr = 0.0;
  if (input.atr && std::isfinite(*input.atr) && *input.atr > 0.0) {
    atr = *input.atr;
  } else {
    const std::optional<double> fetched =
        atr_source_.fetch_atr(input.symbol, asset_class);
    if (!fetched || !(*fetched > 0.0)) {
      return fail(FailureCode::NoAtr, input.symbol,
                  "No ATR available for " + input.symbol +
                      "; cannot compute exit strategy.");
    }
    atr = *fetched;
  }

  // 2. Equity
  const double equity = accounts_.latest_equity(input.account_id)
                            .value_or(limits.default_account_equity);

  // 3. Intent
  domain::TradeIntent intent;
  intent.symbol = input.symbol;
  intent.asset_class = asset_class;
  intent.direction = input.side;
  intent.strategy_tag = strategy;
  intent.confidence = input.confidence;
  intent.regime = regime;
  intent.entry_price = input.entry_price;
  intent.atr = atr;
  intent.account_equity = equity;
  intent.open_positions = accounts_.open_positions(input.account_id);

  // 4. Exit plan
  ExitPlanRequest exit_req;
  exit_req.direction = intent.direction;
  exit_req.entry_price = intent.entry_price;
  exit_req.atr = atr;
  exit_req.asset_class = asset_class;
  exit_req.regime = regime;
  exit_req.strategy_tag = strategy;
  const domain::ExitPlan exits = buildExitPlan(exit_req);

  const bool stop_ok = std::isfinite(exits.stop_price) && exits.stop_price > 0.0;
  const bool tp_ok =
      std::isfinite(exits.take_profit_1) && exits.take_profit_1 > 0.0;
  const bool rr_ok = std::isfinite(exits.rr_at_tp1) && exits.rr_at_tp1 >= 1.0;
  if (!stop_ok || !tp_ok || !rr_ok) {
    return fail(FailureCode::BadExits, input.symbol,
                "Exit strategy invalid for " + input.symbol +
                    ": stop " + fmt(exits.stop_price) + ", tp1 " +
                    fmt(exits.take_profit_1) + ", R:R " +
                    fmt(exits.rr_at_tp1) + ".");
  }

  // 5. Snapshot / lockdown
  SnapshotInput snap_in = input.session.value_or(SnapshotInput{});
  snap_in.guard_enabled = input.guard_enabled;
  snap_in.regime = regime;
  snap_in.market = domain::marketFor(asset_class);
  const PermissionSnapshot snapshot = buildPermissionSnapshot(snap_in);
  if (snapshot.risk_mode == domain::RiskMode::Locked) {
    return fail(FailureCode::RiskLocked, input.symbol,
                "Risk governor is LOCKED; no new entries.");
  }

  // 6. Governor
  const ExposureState exposure =
      accountExposure(accounts_, input.account_id, equity, snapshot);

  domain::GovernorDecision governor = governor_.evaluate(intent, exits, exposure);
  if (!governor.allowed) {
    std::string codes;
    for (const auto& c : governor.reason_codes) {
      if (!codes.empty()) codes += ", ";
      codes += c;
    }
    PipelineFailure f = fail(FailureCode::GovernorBlock, input.symbol,
                             "Execution engine blocked: " + codes);
    f.reason_codes = governor.reason_codes;
    f.required_actions = governor.required_actions;
    return f;
  }

  // 7. Leverage
  LeverageRequest lev_req;
  lev_req.asset_class = asset_class;
  lev_req.regime = regime;
  lev_req.risk_mode = governor.risk_mode;
  lev_req.atr_percent =
      input.entry_price > 0.0 ? atr / input.entry_price * 100.0 : 2.0;
  const domain::LeverageResult leverage = computeLeverage(lev_req);

  // 8. Sizing
  SizingOptions sizing_opts;
  sizing_opts.governor_risk_per_trade = governor.risk_per_trade;
  sizing_opts.governor_max_position_size = governor.max_position_size;
  sizing_opts.effective_leverage = leverage.recommended_leverage;
  sizing_opts.stop_price = exits.stop_price;
  const domain::PositionSizingResult sizing = sizer_.compute(intent, sizing_opts);

  // 9. Entry risk
  PipelineResult r;
  r.entry_risk.normalized_r = equity * 0.01;
  r.entry_risk.dynamic_r = equity * sizing.risk_pct;
  r.entry_risk.risk_per_trade_at_entry = sizing.risk_pct;
  r.entry_risk.equity_at_entry = equity;

  r.exits = exits;
  r.sizing = sizing;
  r.leverage = leverage;
  r.governor = std::move(governor);
  r.atr = atr;
  r.trade_type = leverage.recommended_leverage > 1.0 ? "Margin" : "Spot";
  r.account_equity = equity;
  r.intent = std::move(intent);
  r.engine_regime = regime;
  r.engine_strategy = strategy;
  return r;
}

}  // namespace tradegate
