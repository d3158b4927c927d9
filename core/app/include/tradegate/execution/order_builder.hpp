#pragma once

#include "tradegate/concurrent/id_generator.hpp"
#include "tradegate/domain/exit_plan.hpp"
#include "tradegate/domain/leverage_result.hpp"
#include "tradegate/domain/options_selection.hpp"
#include "tradegate/domain/order_instruction.hpp"
#include "tradegate/domain/position_sizing_result.hpp"
#include "tradegate/domain/trade_intent.hpp"

#include <optional>
#include <string>

namespace tradegate {

struct OrderRequest {
  const domain::TradeIntent& intent;
  const domain::PositionSizingResult& sizing;
  const domain::ExitPlan& exits;
  const domain::LeverageResult& leverage;
  const std::optional<domain::OptionsSelection>& options;
  std::string proposal_id;
};

// -----------------------------------------------------------------------------
// OrderBuilder — assembles the broker-shaped instruction
// -----------------------------------------------------------------------------
//
// @brief  Copies upstream results into an OrderInstruction. Makes no
//         decisions of its own beyond fixed defaults.
//
// @details
// Defaults:
//   order type     LIMIT at the intent's entry price
//   time in force  DAY for equity and options, GTC otherwise
//   side           BUY for LONG, SELL for SHORT; option orders buy the
//                  structure except iron condors, which are sold
//   option right   CALL for LONG, PUT for SHORT
//   leverage       set only when the recommendation exceeds 1x
//   client id      "<prefix>-<n>" from the injected IdGenerator
//
// Thread model:
//   const apart from the shared id generator, which is atomic.
// -----------------------------------------------------------------------------
class OrderBuilder {
 public:
  explicit OrderBuilder(IdGenerator& client_ids) : client_ids_(client_ids) {}

  OrderBuilder(const OrderBuilder&) = delete;
  OrderBuilder& operator=(const OrderBuilder&) = delete;

  domain::OrderInstruction build(const OrderRequest& req) const;

 private:
  IdGenerator& client_ids_;
};

}  // namespace tradegate
