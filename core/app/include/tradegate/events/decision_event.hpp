#pragma once

#include "tradegate/resilience/circuit_breaker.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Decision telemetry events
// -----------------------------------------------------------------------------
//
// @brief  Value types pushed by DecisionEngine onto the IPC telemetry queue
//         and published as JSON on the PUB socket.
//
// @details
//   ProposalEvent        a proposal was assembled (executable or not)
//   PipelineBlockedEvent the execution pipeline short-circuited
//   CircuitStateEvent    a circuit breaker changed state
//
// All three carry the engine clock's epoch ms at creation. They are plain
// data and safe to move across threads.
// -----------------------------------------------------------------------------

struct ProposalEvent {
  std::string proposal_id;
  std::string symbol;
  bool executable{false};
  std::string summary;
  std::vector<std::string> reason_codes;
  std::int64_t timestamp_ms{0};
};

struct PipelineBlockedEvent {
  std::string symbol;
  std::string code;  // NO_ATR, BAD_EXITS, RISK_LOCKED, GOVERNOR_BLOCK
  std::string reason;
  std::vector<std::string> reason_codes;
  std::int64_t timestamp_ms{0};
};

struct CircuitStateEvent {
  std::string circuit;
  CircuitState from{CircuitState::Closed};
  CircuitState to{CircuitState::Closed};
  std::int64_t timestamp_ms{0};
};

using DecisionEvent =
    std::variant<ProposalEvent, PipelineBlockedEvent, CircuitStateEvent>;

}  // namespace tradegate
