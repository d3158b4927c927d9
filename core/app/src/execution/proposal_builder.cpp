#include "tradegate/execution/proposal_builder.hpp"

#include "tradegate/execution/exit_plan_builder.hpp"
#include "tradegate/execution/leverage_selector.hpp"
#include "tradegate/execution/options_selector.hpp"
#include "tradegate/execution/validators.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tradegate {

ProposalBuilder::ProposalBuilder(const ExecutionGovernor& governor,
                                 const OrderBuilder& orders,
                                 IdGenerator& proposal_ids,
                                 const ITimeProvider& clock)
    : governor_(governor),
      sizer_(governor.limits()),
      orders_(orders),
      proposal_ids_(proposal_ids),
      clock_(clock) {}

// ---- build ----
ProposalOutcome ProposalBuilder::build(const domain::TradeIntent& intent,
                                       const ExposureState& exposure) const {
  std::vector<domain::ValidationError> intent_errors = validateIntent(intent);
  if (!intent_errors.empty()) return intent_errors;

  domain::TradeProposal p;
  p.proposal_id = proposal_ids_.next();
  p.created_ms = clock_.now_ms();
  p.intent = intent;
  if (!p.intent.account_equity) {
    p.intent.account_equity = governor_.limits().default_account_equity;
  }
  const domain::TradeIntent& in = p.intent;

  ExitPlanRequest exit_req;
  exit_req.direction = in.direction;
  exit_req.entry_price = in.entry_price;
  exit_req.atr = in.atr;
  exit_req.asset_class = in.asset_class;
  exit_req.regime = in.regime;
  exit_req.strategy_tag = in.strategy_tag;
  exit_req.stop_override = in.stop_price;
  p.exits = buildExitPlan(exit_req);

  p.governor = governor_.evaluate(in, p.exits, exposure);

  LeverageRequest lev_req;
  lev_req.asset_class = in.asset_class;
  lev_req.regime = in.regime;
  lev_req.risk_mode = p.governor.risk_mode;
  lev_req.atr_percent = in.entry_price > 0.0 ? in.atr / in.entry_price * 100.0
                                             : 2.0;
  lev_req.override_leverage = in.leverage;
  p.leverage = computeLeverage(lev_req);

  SizingOptions sizing_opts;
  sizing_opts.governor_risk_per_trade = p.governor.risk_per_trade;
  sizing_opts.governor_max_position_size = p.governor.max_position_size;
  sizing_opts.effective_leverage = p.leverage.recommended_leverage;
  sizing_opts.stop_price = p.exits.stop_price;
  p.sizing = sizer_.compute(in, sizing_opts);

  if (in.asset_class == domain::AssetClass::Options || in.options_structure) {
    OptionsRequest opt_req;
    opt_req.regime = in.regime;
    opt_req.direction = in.direction;
    opt_req.confidence = in.confidence;
    opt_req.entry_price = in.entry_price;
    opt_req.risk_budget_usd = p.sizing.total_risk_usd;
    opt_req.force_structure = in.options_structure;
    opt_req.force_dte = in.options_dte;
    opt_req.force_delta = in.options_delta;
    p.options = selectOptions(opt_req);
  }

  p.order = orders_.build(
      OrderRequest{in, p.sizing, p.exits, p.leverage, p.options, p.proposal_id});

  p.validation_errors = validateProposal(p);
  const bool has_blocking =
      std::any_of(p.validation_errors.begin(), p.validation_errors.end(),
                  [](const domain::ValidationError& e) { return isBlocking(e); });
  p.executable = p.governor.allowed && !has_blocking;
  p.summary = summarizeProposal(p);
  return p;
}

std::string summarizeProposal(const domain::TradeProposal& p) {
  std::ostringstream os;
  os << domain::toString(p.intent.direction) << " " << p.intent.symbol
     << " x " << p.sizing.quantity << " @ " << p.intent.entry_price;
  os << " | Stop " << p.exits.stop_price << " -> TP1 " << p.exits.take_profit_1;
  os << " | Risk $" << std::fixed << std::setprecision(2)
     << p.sizing.total_risk_usd << " (" << p.sizing.risk_pct * 100.0 << "%)";
  os.unsetf(std::ios_base::floatfield);
  os << std::setprecision(6);
  os << " | R:R " << p.exits.rr_at_tp1 << ":1";
  if (p.leverage.recommended_leverage > 1.0) {
    os << " | Leverage " << p.leverage.recommended_leverage << "x";
  }
  if (p.options) {
    os << " | Options: " << domain::toString(p.options->structure) << " "
       << p.options->dte << "DTE " << std::lround(p.options->delta * 100.0)
       << "d";
  }

  if (!p.executable) {
    std::string reasons;
    if (!p.governor.allowed && !p.governor.reason_codes.empty()) {
      for (const auto& c : p.governor.reason_codes) {
        if (!reasons.empty()) reasons += ", ";
        reasons += c;
      }
    } else {
      for (const auto& e : p.validation_errors) {
        if (!reasons.empty()) reasons += ", ";
        reasons += e.code;
      }
    }
    os << " | BLOCKED: " << reasons;
  } else {
    os << " | EXECUTABLE";
  }
  return os.str();
}

}  // namespace tradegate
