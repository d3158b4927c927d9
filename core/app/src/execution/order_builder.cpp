#include "tradegate/execution/order_builder.hpp"

namespace tradegate {

using domain::AssetClass;
using domain::Direction;
using domain::OrderSide;

namespace {

domain::TimeInForce defaultTimeInForce(AssetClass a) {
  switch (a) {
    case AssetClass::Equity:
    case AssetClass::Options:
      return domain::TimeInForce::Day;
    case AssetClass::Crypto:
    case AssetClass::Futures:
    case AssetClass::Forex:
      return domain::TimeInForce::Gtc;
  }
  return domain::TimeInForce::Day;
}

}  // namespace

// ---- build ----
domain::OrderInstruction OrderBuilder::build(const OrderRequest& req) const {
  const domain::TradeIntent& intent = req.intent;
  const bool is_long = intent.direction == Direction::Long;

  domain::OrderInstruction o;
  o.symbol = intent.symbol;
  o.asset_class = intent.asset_class;
  o.side = is_long ? OrderSide::Buy : OrderSide::Sell;
  o.order_type = domain::OrderType::Limit;
  o.time_in_force = defaultTimeInForce(intent.asset_class);
  o.quantity = req.sizing.quantity;
  o.limit_price = intent.entry_price;

  o.bracket_stop = req.exits.stop_price;
  o.bracket_tp1 = req.exits.take_profit_1;
  o.bracket_tp2 = req.exits.take_profit_2;

  if (req.leverage.recommended_leverage > 1.0) {
    o.leverage = req.leverage.recommended_leverage;
  }

  if (req.options) {
    const domain::OptionsSelection& sel = *req.options;
    o.side = sel.structure == domain::OptionsStructure::IronCondor
                 ? OrderSide::Sell
                 : OrderSide::Buy;
    o.option_type =
        is_long ? domain::OptionRight::Call : domain::OptionRight::Put;
    o.strike = sel.strike;
    o.option_dte = sel.dte;
    o.limit_price = sel.premium_est;
  }

  o.client_order_id = client_ids_.next();
  o.proposal_id = req.proposal_id;
  return o;
}

}  // namespace tradegate
