#include "tradegate/engine/decision_engine.hpp"

#include "tradegate/flow/flow_trade_permission.hpp"
#include "tradegate/flow/session_overlay.hpp"
#include "tradegate/scoring/confluence_scorer.hpp"
#include "tradegate/scoring/probability_engine.hpp"
#include "tradegate/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>
#include <variant>

namespace tradegate {

using nlohmann::json;

namespace {

std::string errorResponse(const std::string& message) {
  json j;
  j["status"] = "error";
  j["response"] = message;
  return j.dump();
}

std::string okResponse(json result) {
  json j;
  j["status"] = "ok";
  j["result"] = std::move(result);
  return j.dump();
}

json encodeOverlay(const SessionOverlay& o) {
  json j;
  j["phase"] = toString(o.phase);
  j["market"] = toString(o.market);
  j["tps_adjustment"] = o.tps_adjustment;
  j["size_multiplier_cap"] = o.size_multiplier_cap;
  j["ru_cap_multiplier"] = o.ru_cap_multiplier;
  j["session_allowed"] = o.session_allowed;
  j["session_blocked"] = o.session_blocked;
  j["stop_style_override"] = o.stop_style_override
                                 ? json(toString(*o.stop_style_override))
                                 : json(nullptr);
  j["minimum_confidence"] = o.minimum_confidence;
  j["minimum_liquidity_clarity"] = o.minimum_liquidity_clarity;
  j["minimum_tps"] = o.minimum_tps;
  j["slippage_multiplier"] = o.slippage_multiplier;
  j["reason"] = o.reason;
  j["restrictive"] = o.restrictive;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// AtrRouter: crypto symbols go through the crypto breaker and cache,
// everything else through the market-data ones.
// -----------------------------------------------------------------------------
class DecisionEngine::AtrRouter final : public IAtrSource {
 public:
  AtrRouter(IAtrSource& equity, IAtrSource& crypto)
      : equity_(equity), crypto_(crypto) {}

  std::optional<double> fetch_atr(const std::string& symbol,
                                  domain::AssetClass asset_class) override {
    return domain::isCrypto(asset_class)
               ? crypto_.fetch_atr(symbol, asset_class)
               : equity_.fetch_atr(symbol, asset_class);
  }

 private:
  IAtrSource& equity_;
  IAtrSource& crypto_;
};

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
DecisionEngine::DecisionEngine(const ITimeProvider& clock, IAtrSource& atr_feed,
                               const IAccountStore& accounts,
                               EngineConfig config)
    : clock_(clock),
      atr_feed_(atr_feed),
      accounts_(accounts),
      config_(std::move(config)),
      market_data_breaker_("market-data", clock_,
                           withTelemetry(config_.market_data_breaker)),
      crypto_data_breaker_("crypto-data", clock_,
                           withTelemetry(config_.crypto_data_breaker)),
      equity_atr_(atr_feed_, market_data_breaker_, clock_,
                  config_.atr_cache_ttl_ms),
      crypto_atr_(atr_feed_, crypto_data_breaker_, clock_,
                  config_.atr_cache_ttl_ms),
      atr_router_(std::make_unique<AtrRouter>(equity_atr_, crypto_atr_)),
      matrix_(StaticClusterResolver::instance()),
      governor_(config_.execution, matrix_),
      institutional_(config_.institutional, StaticClusterResolver::instance()),
      orders_(order_ids_),
      proposals_(governor_, orders_, proposal_ids_, clock_),
      pipeline_(*atr_router_, accounts_, governor_) {}

DecisionEngine::~DecisionEngine() { stop(); }

CircuitBreakerOptions DecisionEngine::withTelemetry(CircuitBreakerOptions base) {
  auto downstream = std::move(base.on_state_change);
  base.on_state_change = [this, downstream](const std::string& name,
                                            CircuitState from,
                                            CircuitState to) {
    publish(CircuitStateEvent{name, from, to, clock_.now_ms()});
    if (downstream) downstream(name, from, to);
  };
  return base;
}

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void DecisionEngine::start() {
  std::lock_guard<std::mutex> lock(telemetry_mutex_);
  if (ipc_server_ || config_.ipc_cmd_endpoint.empty() ||
      config_.ipc_pub_endpoint.empty()) {
    return;
  }
  auto server = std::make_unique<IpcServer>(
      [this](const std::string& cmd) { return executeCommand(cmd); },
      config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
  server->start();
  ipc_server_ = std::move(server);
  std::cout << "[DecisionEngine] started.\n";
}

void DecisionEngine::stop() {
  std::unique_ptr<IpcServer> server;
  {
    std::lock_guard<std::mutex> lock(telemetry_mutex_);
    server = std::move(ipc_server_);
  }
  // Joined outside the lock: the worker may be inside publish().
  if (server) {
    server->stop();
    std::cout << "[DecisionEngine] stopped.\n";
  }
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
void DecisionEngine::subscribeTelemetry(TelemetrySink sink) {
  std::lock_guard<std::mutex> lock(telemetry_mutex_);
  sinks_.push_back(std::move(sink));
}

void DecisionEngine::publish(DecisionEvent event) {
  std::lock_guard<std::mutex> lock(telemetry_mutex_);
  for (const auto& sink : sinks_) {
    sink(event);
  }
  if (ipc_server_) {
    ipc_server_->pushTelemetry(std::move(event));
  }
}

std::vector<CircuitSnapshot> DecisionEngine::breakerSnapshots() const {
  return {market_data_breaker_.snapshot(), crypto_data_breaker_.snapshot()};
}

// -----------------------------------------------------------------------------
// evaluate()
// -----------------------------------------------------------------------------
PipelineOutcome DecisionEngine::evaluate(const PipelineInput& input) {
  PipelineOutcome outcome = pipeline_.run(input);
  if (const auto* f = std::get_if<PipelineFailure>(&outcome)) {
    publish(PipelineBlockedEvent{input.symbol, toString(f->code), f->reason,
                                 f->reason_codes, clock_.now_ms()});
  }
  return outcome;
}

// -----------------------------------------------------------------------------
// propose() / proposeForAccount()
// -----------------------------------------------------------------------------
ProposalOutcome DecisionEngine::propose(const domain::TradeIntent& intent,
                                        const ExposureState& exposure) {
  ProposalOutcome outcome = proposals_.build(intent, exposure);

  if (const auto* p = std::get_if<domain::TradeProposal>(&outcome)) {
    ProposalEvent e;
    e.proposal_id = p->proposal_id;
    e.symbol = p->intent.symbol;
    e.executable = p->executable;
    e.summary = p->summary;
    if (!p->governor.allowed) {
      e.reason_codes = p->governor.reason_codes;
    } else {
      for (const auto& v : p->validation_errors) {
        e.reason_codes.push_back(v.code);
      }
    }
    e.timestamp_ms = clock_.now_ms();
    publish(std::move(e));
  } else {
    const auto& errors = std::get<std::vector<domain::ValidationError>>(outcome);
    std::cerr << "[DecisionEngine] intent for " << intent.symbol
              << " rejected: " << errors.size() << " validation error(s)\n";
  }
  return outcome;
}

ProposalOutcome DecisionEngine::proposeForAccount(const std::string& account_id,
                                                  domain::TradeIntent intent) {
  if (!intent.account_equity) {
    intent.account_equity = accounts_.latest_equity(account_id)
                                .value_or(config_.execution.default_account_equity);
  }
  if (intent.open_positions.empty()) {
    intent.open_positions = accounts_.open_positions(account_id);
  }
  const ExposureState exposure =
      accountExposure(accounts_, account_id, *intent.account_equity,
                      std::nullopt);
  return propose(intent, exposure);
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command dispatch
// -----------------------------------------------------------------------------
std::string DecisionEngine::executeCommand(const std::string& cmd) {
  const auto first = cmd.find_first_not_of(" \t\r\n");
  if (first != std::string::npos && cmd[first] == '{') {
    return handleJsonCommand(cmd);
  }

  json response;
  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    json breakers = json::array();
    for (const auto& s : breakerSnapshots()) {
      breakers.push_back(toJson(s));
    }
    response["breakers"] = std::move(breakers);
    response["atr_cache_entries"] =
        equity_atr_.cached_entries() + crypto_atr_.cached_entries();
    {
      std::lock_guard<std::mutex> lock(telemetry_mutex_);
      response["ipc_running"] = ipc_server_ != nullptr;
      if (ipc_server_) {
        response["ipc_commands_served"] = ipc_server_->commandsServed();
        response["ipc_events_published"] = ipc_server_->eventsPublished();
      }
    }
    response["now_ms"] = clock_.now_ms();
  } else {
    std::cerr << "[DecisionEngine] unknown command: " << cmd << "\n";
    return errorResponse("Unknown command: " + cmd);
  }
  return response.dump();
}

std::string DecisionEngine::handleJsonCommand(const std::string& raw) {
  json req;
  try {
    req = json::parse(raw);
  } catch (const json::parse_error& e) {
    std::cerr << "[DecisionEngine] malformed request: " << e.what() << "\n";
    return errorResponse(std::string("Malformed request: ") + e.what());
  }

  const auto cmd_it = req.find("cmd");
  if (cmd_it == req.end() || !cmd_it->is_string()) {
    std::cerr << "[DecisionEngine] malformed request: missing cmd\n";
    return errorResponse("Malformed request: missing \"cmd\"");
  }
  const std::string name = cmd_it->get<std::string>();

  try {
    if (name == "EVALUATE") {
      return okResponse(toJson(evaluate(decodePipelineInput(req))));
    }

    if (name == "PROPOSE") {
      const auto intent_it = req.find("intent");
      if (intent_it == req.end()) {
        return errorResponse("PROPOSE requires \"intent\"");
      }
      const domain::TradeIntent intent = decodeTradeIntent(*intent_it);
      const auto exposure_it = req.find("exposure");
      ProposalOutcome outcome =
          exposure_it != req.end()
              ? propose(intent, decodeExposure(*exposure_it, intent))
              : proposeForAccount(req.value("account_id", std::string()),
                                  intent);
      if (const auto* p = std::get_if<domain::TradeProposal>(&outcome)) {
        return okResponse(toJson(*p));
      }
      json j;
      j["status"] = "error";
      j["response"] = "Intent failed validation";
      j["validation_errors"] =
          toJson(std::get<std::vector<domain::ValidationError>>(outcome));
      return j.dump();
    }

    if (name == "SCORE_CONFLUENCE") {
      const ConfluenceComponents components = decodeConfluenceComponents(
          req.value("components", json::object()));
      const ScoringRegime regime =
          mapToScoringRegime(req.value("regime", std::string("TRANSITION")));
      return okResponse(toJson(scoreConfluence(components, regime)));
    }

    if (name == "WIN_PROBABILITY") {
      return okResponse(
          toJson(calculateWinProbability(decodeProbabilityRequest(req))));
    }

    if (name == "FLOW_PERMISSION") {
      return okResponse(
          toJson(computeFlowTradePermission(decodeFlowPermissionInput(req))));
    }

    if (name == "INSTITUTIONAL_RISK") {
      return okResponse(
          toJson(institutional_.evaluate(decodeInstitutionalRiskInput(req))));
    }

    if (name == "SESSION") {
      const auto market = domain::parseMarket(
          req.value("market", std::string("equities")));
      if (!market) {
        return errorResponse("SESSION: unknown market");
      }
      return okResponse(encodeOverlay(currentSessionOverlay(*market, clock_)));
    }
  } catch (const CodecError& e) {
    std::cerr << "[DecisionEngine] bad " << name << " request: " << e.what()
              << "\n";
    return errorResponse(name + ": " + e.what());
  } catch (const json::exception& e) {
    std::cerr << "[DecisionEngine] bad " << name << " request: " << e.what()
              << "\n";
    return errorResponse(name + ": " + e.what());
  }

  std::cerr << "[DecisionEngine] unknown command: " << name << "\n";
  return errorResponse("Unknown command: " + name);
}

}  // namespace tradegate
