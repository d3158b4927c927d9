#pragma once

#include "tradegate/concurrent/id_generator.hpp"
#include "tradegate/domain/trade_proposal.hpp"
#include "tradegate/execution/order_builder.hpp"
#include "tradegate/execution/position_sizer.hpp"
#include "tradegate/risk/execution_governor.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tradegate {

// Either a complete proposal (executable or not) or the intent's validation
// errors when the intent itself was malformed.
using ProposalOutcome =
    std::variant<domain::TradeProposal, std::vector<domain::ValidationError>>;

// -----------------------------------------------------------------------------
// ProposalBuilder — runs every execution module for one intent
// -----------------------------------------------------------------------------
//
// @brief  Produces the full trade decision object: governor verdict, exits,
//         leverage, sizing, optional options structure, order and summary.
//
// @details
// Sequence:
//   1. validateIntent; any error returns the error list
//   2. equity defaults to ExecutionLimits::default_account_equity
//   3. exit plan (honouring the intent's stop)
//   4. ExecutionGovernor::evaluate with the caller's exposure
//   5. leverage (honouring the intent's override) from the governor's mode
//   6. sizing with the governor's risk per trade, max size and the
//      recommended leverage
//   7. options selection when the asset class is options or a structure
//      was forced; risk budget is the sized dollar risk
//   8. order, then validateProposal
//
// Unlike ExecutionPipeline nothing short-circuits after step 1: a blocked
// proposal is still fully populated so the caller can show what would have
// been traded and why it was refused.
//
// Thread model:
//   build() is const; concurrent calls share only the atomic id generators
//   and the time provider.
// -----------------------------------------------------------------------------
class ProposalBuilder {
 public:
  ProposalBuilder(const ExecutionGovernor& governor,
                  const OrderBuilder& orders, IdGenerator& proposal_ids,
                  const ITimeProvider& clock);

  ProposalBuilder(const ProposalBuilder&) = delete;
  ProposalBuilder& operator=(const ProposalBuilder&) = delete;

  ProposalOutcome build(const domain::TradeIntent& intent,
                        const ExposureState& exposure) const;

 private:
  const ExecutionGovernor& governor_;
  PositionSizer sizer_;
  const OrderBuilder& orders_;
  IdGenerator& proposal_ids_;
  const ITimeProvider& clock_;
};

// One-line human summary, e.g.
// "LONG AAPL x 250 @ 100 | Stop 98 -> TP1 104 | Risk $500.00 (0.75%) |
//  R:R 2:1 | EXECUTABLE"
std::string summarizeProposal(const domain::TradeProposal& p);

}  // namespace tradegate
