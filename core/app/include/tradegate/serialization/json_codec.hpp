#pragma once

#include "tradegate/domain/governor_decision.hpp"
#include "tradegate/domain/trade_proposal.hpp"
#include "tradegate/events/decision_event.hpp"
#include "tradegate/execution/execution_pipeline.hpp"
#include "tradegate/flow/flow_trade_permission.hpp"
#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/risk/execution_governor.hpp"
#include "tradegate/risk/institutional_risk_governor.hpp"
#include "tradegate/scoring/confluence_scorer.hpp"
#include "tradegate/scoring/probability_engine.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

namespace tradegate {

// Thrown by the decode functions for missing required fields, wrong JSON
// types and unknown enum labels. The message names the offending field.
class CodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Request decoding and result encoding for the IPC surface.
//
// @details
// The core library is wire-format agnostic; this file is the only place
// that knows field names on the wire. Keys are snake_case and mirror the
// C++ member names. Enum values travel as the toString() labels and are
// decoded case-insensitively through the matching parseX() function.
//
// Decoders apply the struct defaults for absent optional keys. Only keys
// the request cannot do without are required (symbol, entry_price, and so
// on); their absence throws CodecError.
// -----------------------------------------------------------------------------

// ---- decoding ----

domain::TradeIntent decodeTradeIntent(const nlohmann::json& j);

// "session" (optional) holds SnapshotInput fields; regime and market fall
// back to the intent's.
ExposureState decodeExposure(const nlohmann::json& j,
                             const domain::TradeIntent& intent);

SnapshotInput decodeSnapshotInput(const nlohmann::json& j,
                                  SnapshotInput defaults = {});

PipelineInput decodePipelineInput(const nlohmann::json& j);

ConfluenceComponents decodeConfluenceComponents(const nlohmann::json& j);

ProbabilityRequest decodeProbabilityRequest(const nlohmann::json& j);

// "session_phase" (optional) selects the overlay; "market" picks the table.
FlowPermissionInput decodeFlowPermissionInput(const nlohmann::json& j);

InstitutionalRiskInput decodeInstitutionalRiskInput(const nlohmann::json& j);

// ---- encoding ----

nlohmann::json toJson(const domain::TradeIntent& intent);
nlohmann::json toJson(const domain::ExitPlan& exits);
nlohmann::json toJson(const domain::PositionSizingResult& sizing);
nlohmann::json toJson(const domain::LeverageResult& leverage);
nlohmann::json toJson(const domain::OptionsSelection& options);
nlohmann::json toJson(const domain::GovernorDecision& decision);
nlohmann::json toJson(const domain::OrderInstruction& order);
nlohmann::json toJson(const domain::ValidationError& error);
nlohmann::json toJson(const std::vector<domain::ValidationError>& errors);
nlohmann::json toJson(const domain::TradeProposal& proposal);

nlohmann::json toJson(const PipelineResult& result);
nlohmann::json toJson(const PipelineFailure& failure);
nlohmann::json toJson(const PipelineOutcome& outcome);

nlohmann::json toJson(const ConfluenceResult& result);
nlohmann::json toJson(const ProbabilityResult& result);
nlohmann::json toJson(const FlowPermission& permission);
nlohmann::json toJson(const InstitutionalRiskOutput& output);

nlohmann::json toJson(const CircuitSnapshot& snapshot);
nlohmann::json toJson(const DecisionEvent& event);

}  // namespace tradegate
