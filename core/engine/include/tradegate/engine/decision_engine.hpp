#pragma once

#include "tradegate/concurrent/id_generator.hpp"
#include "tradegate/config/engine_config.hpp"
#include "tradegate/events/decision_event.hpp"
#include "tradegate/execution/execution_pipeline.hpp"
#include "tradegate/execution/order_builder.hpp"
#include "tradegate/execution/proposal_builder.hpp"
#include "tradegate/market/cached_atr_source.hpp"
#include "tradegate/market/i_account_store.hpp"
#include "tradegate/market/i_atr_source.hpp"
#include "tradegate/network/ipc_server.hpp"
#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/risk/execution_governor.hpp"
#include "tradegate/risk/institutional_risk_governor.hpp"
#include "tradegate/risk/permission_matrix.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// DecisionEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the service: wires the gating components
//         together, owns the circuit breakers and the IPC server, and
//         answers commands.
//
// @details
// The core modules are pure functions or const objects; this class is the
// stateful edge. It owns one breaker per upstream feed (equities and
// crypto), a TTL cache in front of each, and routes ATR lookups by asset
// class. Every proposal and every pipeline short-circuit is published as a
// DecisionEvent: to the IPC PUB socket when running, and to any sinks added
// with subscribeTelemetry().
//
// Commands (executeCommand):
//   "PING"                          -> {"status":"ok","response":"PONG"}
//   "STATUS"                        -> breaker snapshots, cache size
//   {"cmd":"EVALUATE", ...}         -> ExecutionPipeline outcome
//   {"cmd":"PROPOSE", ...}          -> TradeProposal or validation errors
//   {"cmd":"SCORE_CONFLUENCE", ...} -> ConfluenceResult
//   {"cmd":"WIN_PROBABILITY", ...}  -> ProbabilityResult
//   {"cmd":"FLOW_PERMISSION", ...}  -> FlowPermission
//   {"cmd":"INSTITUTIONAL_RISK", ...} -> InstitutionalRiskOutput
//   {"cmd":"SESSION", "market":...} -> current session phase and overlay
//   anything else                   -> {"status":"error", ...}
//
// Thread model:
//   start() / stop() from the owning thread. evaluate(), propose() and
//   executeCommand() may be called from any thread, including the IPC
//   worker; the collaborators they touch are thread-safe.
//
// Ownership:
//   DecisionEngine
//    ├── clock_, atr_feed_, accounts_  (non-owning references, must outlive)
//    ├── config_                       (EngineConfig, value)
//    ├── market_data_breaker_, crypto_data_breaker_
//    ├── equity_atr_, crypto_atr_      (CachedAtrSource over atr_feed_)
//    ├── atr_router_                   (IAtrSource, picks a cache by class)
//    ├── matrix_, governor_, institutional_
//    ├── order_ids_, proposal_ids_, orders_, proposals_, pipeline_
//    └── ipc_server_                   (unique_ptr, only while started)
// -----------------------------------------------------------------------------
class DecisionEngine {
 public:
  using TelemetrySink = std::function<void(const DecisionEvent&)>;

  DecisionEngine(const ITimeProvider& clock, IAtrSource& atr_feed,
                 const IAccountStore& accounts, EngineConfig config = {});

  // Calls stop().
  ~DecisionEngine();

  DecisionEngine(const DecisionEngine&) = delete;
  DecisionEngine& operator=(const DecisionEngine&) = delete;
  DecisionEngine(DecisionEngine&&) = delete;
  DecisionEngine& operator=(DecisionEngine&&) = delete;

  // Starts the IPC server unless either endpoint is empty. Idempotent.
  void start();

  // Stops the IPC server. Idempotent.
  void stop();

  PipelineOutcome evaluate(const PipelineInput& input);

  ProposalOutcome propose(const domain::TradeIntent& intent,
                          const ExposureState& exposure);

  // Exposure derived from the account store; the intent's equity is filled
  // from the store when absent.
  ProposalOutcome proposeForAccount(const std::string& account_id,
                                    domain::TradeIntent intent);

  std::string executeCommand(const std::string& cmd);

  // Sinks run on the publishing thread and must not call back into the
  // engine.
  void subscribeTelemetry(TelemetrySink sink);

  std::vector<CircuitSnapshot> breakerSnapshots() const;

  const EngineConfig& config() const { return config_; }

 private:
  class AtrRouter;

  void publish(DecisionEvent event);

  // base plus a callback that publishes CircuitStateEvent.
  CircuitBreakerOptions withTelemetry(CircuitBreakerOptions base);

  std::string handleJsonCommand(const std::string& raw);

  const ITimeProvider& clock_;
  IAtrSource& atr_feed_;
  const IAccountStore& accounts_;
  EngineConfig config_;

  CircuitBreaker market_data_breaker_;
  CircuitBreaker crypto_data_breaker_;
  CachedAtrSource equity_atr_;
  CachedAtrSource crypto_atr_;
  std::unique_ptr<AtrRouter> atr_router_;

  PermissionMatrix matrix_;
  ExecutionGovernor governor_;
  InstitutionalRiskGovernor institutional_;

  IdGenerator order_ids_{"tg"};
  IdGenerator proposal_ids_{"prop"};
  OrderBuilder orders_;
  ProposalBuilder proposals_;
  ExecutionPipeline pipeline_;

  // Guards sinks_ and ipc_server_.
  mutable std::mutex telemetry_mutex_;
  std::vector<TelemetrySink> sinks_;
  std::unique_ptr<IpcServer> ipc_server_;
};

}  // namespace tradegate
