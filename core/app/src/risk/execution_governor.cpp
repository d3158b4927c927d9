#include "tradegate/risk/execution_governor.hpp"

#include "tradegate/risk/reason_codes.hpp"

#include <iomanip>
#include <sstream>

namespace tradegate {

namespace {

std::string pct(double fraction, int precision) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
  return os.str();
}

std::string fixed2(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << v;
  return os.str();
}

}  // namespace

CandidateIntent toCandidate(const domain::TradeIntent& intent,
                            double stop_price) {
  CandidateIntent c;
  c.symbol = intent.symbol;
  c.market = domain::marketFor(intent.asset_class);
  c.strategy_tag = intent.strategy_tag;
  c.direction = intent.direction;
  c.confidence = intent.confidence;
  c.entry_price = intent.entry_price;
  c.stop_price = stop_price;
  c.atr = intent.atr;
  c.event_severity = intent.event_severity;
  c.open_positions = intent.open_positions;
  return c;
}

PermissionSnapshot defaultSnapshotFor(const domain::TradeIntent& intent) {
  SnapshotInput in;
  in.regime = intent.regime;
  in.event_severity = intent.event_severity;
  in.market = domain::marketFor(intent.asset_class);
  return buildPermissionSnapshot(in);
}

ExecutionGovernor::ExecutionGovernor(domain::ExecutionLimits limits,
                                     const PermissionMatrix& matrix)
    : limits_(limits), matrix_(matrix) {}

// ---- evaluate: matrix verdict, then execution hard limits ----

domain::GovernorDecision ExecutionGovernor::evaluate(
    const domain::TradeIntent& intent, const domain::ExitPlan& exits,
    const ExposureState& exposure) const {
  const PermissionSnapshot snapshot =
      exposure.snapshot ? *exposure.snapshot : defaultSnapshotFor(intent);

  domain::GovernorDecision d;
  d.raw = matrix_.evaluateCandidate(snapshot,
                                    toCandidate(intent, exits.stop_price));
  d.permission = d.raw.permission;
  d.risk_mode = d.raw.risk_mode;
  d.risk_per_trade = d.raw.risk_per_trade;
  d.max_position_size = d.raw.max_position_size;
  d.reason_codes = d.raw.reason_codes;
  d.required_actions = d.raw.required_actions;
  d.allowed = d.raw.permission != domain::Permission::Block;

  auto fail = [&d](const char* code, std::string action) {
    d.allowed = false;
    d.reason_codes.push_back(code);
    d.required_actions.push_back(std::move(action));
  };

  if (exposure.daily_loss_pct >= limits_.max_daily_loss_pct) {
    fail(reason::kExecDailyLossCap,
         "Daily loss " + pct(exposure.daily_loss_pct, 2) +
             " >= " + pct(limits_.max_daily_loss_pct, 1) +
             " cap; no new trades.");
  }

  if (exposure.portfolio_heat_pct >= limits_.max_portfolio_heat_pct) {
    fail(reason::kExecPortfolioHeat,
         "Portfolio heat " + pct(exposure.portfolio_heat_pct, 2) + " >= " +
             pct(limits_.max_portfolio_heat_pct, 1) + "; reduce open risk.");
  }

  if (exposure.open_trade_count >= limits_.max_open_trades) {
    fail(reason::kExecMaxOpenTrades,
         std::to_string(exposure.open_trade_count) + " open trades >= " +
             std::to_string(limits_.max_open_trades) + " hard cap.");
  }

  if (exits.rr_at_tp1 < limits_.min_required_rr) {
    std::ostringstream os;
    os << "R:R at TP1 " << fixed2(exits.rr_at_tp1) << " < "
       << limits_.min_required_rr << " minimum.";
    fail(reason::kExecMinRr, os.str());
  }

  const double risk_pct = intent.risk_pct.value_or(d.raw.risk_per_trade);
  if (risk_pct > limits_.max_single_trade_risk_pct) {
    fail(reason::kExecSingleTradeRisk,
         "Risk per trade " + pct(risk_pct, 2) + " > " +
             pct(limits_.max_single_trade_risk_pct, 1) + " cap.");
  }

  return d;
}

}  // namespace tradegate
