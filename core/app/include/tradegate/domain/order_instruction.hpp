#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>
#include <string>

namespace tradegate {
namespace domain {

enum class OrderSide {
  Buy,
  Sell,
};

enum class OptionRight {
  Call,
  Put,
};

inline const char* toString(OrderSide s) {
  return s == OrderSide::Buy ? "BUY" : "SELL";
}

inline const char* toString(OptionRight r) {
  return r == OptionRight::Call ? "CALL" : "PUT";
}

// -----------------------------------------------------------------------------
// OrderInstruction — broker-shaped order assembled by OrderBuilder
// -----------------------------------------------------------------------------
//
// @details
// Never transmitted by this library. Bracket fields mirror the ExitPlan;
// option fields are present only when an OptionsSelection was made.
// option_dte stands in for an expiration date: the core has no calendar.
// -----------------------------------------------------------------------------
struct OrderInstruction {
  std::string symbol;
  OrderSide side{OrderSide::Buy};
  OrderType order_type{OrderType::Limit};
  TimeInForce time_in_force{TimeInForce::Day};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> stop_price;

  std::optional<double> bracket_stop;
  std::optional<double> bracket_tp1;
  std::optional<double> bracket_tp2;
  std::optional<double> leverage;
  AssetClass asset_class{AssetClass::Equity};

  std::optional<OptionRight> option_type;
  std::optional<double> strike;
  std::optional<int> option_dte;

  std::string client_order_id;
  std::string proposal_id;
};

}  // namespace domain
}  // namespace tradegate
