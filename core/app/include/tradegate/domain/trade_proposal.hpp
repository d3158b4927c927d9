#pragma once

#include "tradegate/domain/exit_plan.hpp"
#include "tradegate/domain/governor_decision.hpp"
#include "tradegate/domain/leverage_result.hpp"
#include "tradegate/domain/options_selection.hpp"
#include "tradegate/domain/order_instruction.hpp"
#include "tradegate/domain/position_sizing_result.hpp"
#include "tradegate/domain/trade_intent.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace domain {

struct ValidationError {
  std::string field;
  std::string code;
  std::string message;
};

// -----------------------------------------------------------------------------
// TradeProposal — the full decision object for one intent
// -----------------------------------------------------------------------------
//
// @details
// executable == governor.allowed && no blocking validation error.
// HIGH_NOTIONAL is advisory and never blocks.
// created_ms comes from the ITimeProvider injected into ProposalBuilder.
// -----------------------------------------------------------------------------
struct TradeProposal {
  std::string proposal_id;
  std::int64_t created_ms{0};
  TradeIntent intent;
  GovernorDecision governor;
  PositionSizingResult sizing;
  ExitPlan exits;
  LeverageResult leverage;
  std::optional<OptionsSelection> options;
  OrderInstruction order;
  std::vector<ValidationError> validation_errors;
  bool executable{false};
  std::string summary;
};

}  // namespace domain
}  // namespace tradegate
