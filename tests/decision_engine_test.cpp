// =============================================================================
// decision_engine_test.cpp
// =============================================================================
// Tests for tradegate::DecisionEngine through its command surface.
//
// Validates:
//   - PING / STATUS / unknown and malformed commands
//   - EVALUATE routes ATR lookups through the per-market caches
//   - PROPOSE with explicit exposure, from the account store, and invalid
//   - telemetry sinks see proposals, pipeline blocks and breaker transitions
//   - SESSION, SCORE_CONFLUENCE and WIN_PROBABILITY dispatch
//   - start() is a no-op when the IPC endpoints are empty
//
// Design: Each test builds its own engine with IPC disabled. No sockets.
// =============================================================================

#include "tradegate/engine/decision_engine.hpp"
#include "tradegate/market/i_account_store.hpp"
#include "tradegate/market/static_atr_source.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using nlohmann::json;
using tradegate::DecisionEvent;

namespace {

constexpr std::int64_t kFifteenUtcMs = 15LL * 3600 * 1000;

// Static ATRs for equities; crypto lookups throw while `crypto_down` is set.
class FlakyAtrFeed final : public tradegate::IAtrSource {
 public:
  std::optional<double> fetch_atr(
      const std::string& symbol,
      tradegate::domain::AssetClass asset_class) override {
    ++calls;
    if (crypto_down && tradegate::domain::isCrypto(asset_class)) {
      throw std::runtime_error("exchange unreachable");
    }
    return table.fetch_atr(symbol, asset_class);
  }

  tradegate::StaticAtrSource table;
  bool crypto_down{false};
  int calls{0};
};

tradegate::EngineConfig offlineConfig() {
  tradegate::EngineConfig cfg;
  cfg.ipc_cmd_endpoint.clear();
  cfg.ipc_pub_endpoint.clear();
  cfg.crypto_data_breaker.failure_threshold = 2;
  return cfg;
}

}  // namespace

class DecisionEngineTest : public ::testing::Test {
 protected:
  DecisionEngineTest()
      : clock(kFifteenUtcMs), engine(clock, feed, accounts, offlineConfig()) {
    feed.table.set_atr("SPY", 2.0);
    accounts.set_equity("acct-1", 100000.0);
    engine.subscribeTelemetry(
        [this](const DecisionEvent& e) { events.push_back(e); });
  }

  json command(const json& request) {
    return json::parse(engine.executeCommand(request.dump()));
  }

  static json evaluateRequest(const std::string& symbol,
                              const std::string& asset_class) {
    return {{"cmd", "EVALUATE"},      {"account_id", "acct-1"},
            {"symbol", symbol},       {"entry_price", 100},
            {"asset_class", asset_class}, {"confidence", 80},
            {"regime", "trend up"},   {"strategy_tag", "scanner_signal"}};
  }

  static json spyIntent() {
    return {{"symbol", "SPY"},          {"direction", "LONG"},
            {"strategy_tag", "TREND_PULLBACK"}, {"regime", "TREND_UP"},
            {"confidence", 80},         {"entry_price", 100},
            {"atr", 2}};
  }

  tradegate::SimulationTimeProvider clock;
  FlakyAtrFeed feed;
  tradegate::InMemoryAccountStore accounts;
  tradegate::DecisionEngine engine;
  std::vector<DecisionEvent> events;
};

// -----------------------------------------------------------------------------
// 1. Plain-text commands.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, PingAndUnknown) {
  const json ping = json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  const json unknown = json::parse(engine.executeCommand("SHUTDOWN"));
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: SHUTDOWN");
}

// -----------------------------------------------------------------------------
// 2. Malformed JSON and a missing cmd are errors, never exceptions.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, MalformedRequests) {
  const json bad = json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(bad["status"], "error");
  EXPECT_EQ(bad["response"].get<std::string>().rfind("Malformed request: ", 0),
            0u);

  const json no_cmd = command({{"symbol", "SPY"}});
  EXPECT_EQ(no_cmd["response"], "Malformed request: missing \"cmd\"");

  const json missing = command({{"cmd", "EVALUATE"}, {"entry_price", 100}});
  EXPECT_EQ(missing["status"], "error");
  EXPECT_EQ(missing["response"], "EVALUATE: symbol is required");

  const json other = command({{"cmd", "REBALANCE"}});
  EXPECT_EQ(other["response"], "Unknown command: REBALANCE");
}

// -----------------------------------------------------------------------------
// 3. EVALUATE fetches the ATR once, then serves it from the cache.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, EvaluateUsesCachedAtr) {
  const json first = command(evaluateRequest("SPY", "equity"));
  ASSERT_EQ(first["status"], "ok");
  const json& r = first["result"];
  EXPECT_TRUE(r["ok"].get<bool>());
  EXPECT_DOUBLE_EQ(r["atr"].get<double>(), 2.0);
  EXPECT_DOUBLE_EQ(r["sizing"]["quantity"].get<double>(), 250.0);
  EXPECT_EQ(r["trade_type"], "Margin");
  EXPECT_EQ(r["engine_regime"], "TREND_UP");

  command(evaluateRequest("SPY", "equity"));
  EXPECT_EQ(feed.calls, 1);

  const json status = json::parse(engine.executeCommand("STATUS"));
  EXPECT_EQ(status["atr_cache_entries"].get<int>(), 1);
  EXPECT_FALSE(status["ipc_running"].get<bool>());
  EXPECT_EQ(status["now_ms"].get<std::int64_t>(), kFifteenUtcMs);
  ASSERT_EQ(status["breakers"].size(), 2u);
  EXPECT_EQ(status["breakers"][0]["name"], "market-data");
  EXPECT_EQ(status["breakers"][1]["name"], "crypto-data");
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 4. Missing ATR is reported and published as a pipeline block.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, NoAtrPublishesBlock) {
  const json resp = command(evaluateRequest("IWM", "equity"));
  ASSERT_EQ(resp["status"], "ok");
  EXPECT_FALSE(resp["result"]["ok"].get<bool>());
  EXPECT_EQ(resp["result"]["code"], "NO_ATR");

  ASSERT_EQ(events.size(), 1u);
  const auto* blocked = std::get_if<tradegate::PipelineBlockedEvent>(&events[0]);
  ASSERT_NE(blocked, nullptr);
  EXPECT_EQ(blocked->symbol, "IWM");
  EXPECT_EQ(blocked->code, "NO_ATR");
  EXPECT_EQ(blocked->timestamp_ms, kFifteenUtcMs);
}

// -----------------------------------------------------------------------------
// 5. A failing crypto feed opens only the crypto breaker.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, CryptoBreakerOpensIndependently) {
  feed.crypto_down = true;
  command(evaluateRequest("BTC-USD", "crypto"));
  command(evaluateRequest("BTC-USD", "crypto"));

  const auto snaps = engine.breakerSnapshots();
  EXPECT_EQ(snaps[0].state, tradegate::CircuitState::Closed);
  EXPECT_EQ(snaps[1].state, tradegate::CircuitState::Open);

  // block, transition, block
  ASSERT_EQ(events.size(), 3u);
  const auto* transition = std::get_if<tradegate::CircuitStateEvent>(&events[1]);
  ASSERT_NE(transition, nullptr);
  EXPECT_EQ(transition->circuit, "crypto-data");
  EXPECT_EQ(transition->from, tradegate::CircuitState::Closed);
  EXPECT_EQ(transition->to, tradegate::CircuitState::Open);

  // Equities still flow.
  EXPECT_TRUE(command(evaluateRequest("SPY", "equity"))["result"]["ok"].get<bool>());
}

// -----------------------------------------------------------------------------
// 6. PROPOSE with explicit exposure.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ProposeWithExposure) {
  const json resp = command({{"cmd", "PROPOSE"},
                             {"intent", spyIntent()},
                             {"exposure", {{"daily_loss_pct", 0.0}}}});
  ASSERT_EQ(resp["status"], "ok");
  const json& p = resp["result"];
  EXPECT_EQ(p["proposal_id"], "prop-1");
  EXPECT_TRUE(p["executable"].get<bool>());
  EXPECT_EQ(p["order"]["client_order_id"], "tg-1");
  EXPECT_DOUBLE_EQ(p["sizing"]["quantity"].get<double>(), 250.0);

  ASSERT_EQ(events.size(), 1u);
  const auto* e = std::get_if<tradegate::ProposalEvent>(&events[0]);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->proposal_id, "prop-1");
  EXPECT_TRUE(e->executable);
  EXPECT_TRUE(e->reason_codes.empty());
}

// -----------------------------------------------------------------------------
// 7. PROPOSE without exposure reads the account store.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ProposeFromAccountStore) {
  accounts.set_daily_realized_pnl("acct-1", -2500.0);
  const json resp = command(
      {{"cmd", "PROPOSE"}, {"account_id", "acct-1"}, {"intent", spyIntent()}});
  ASSERT_EQ(resp["status"], "ok");
  EXPECT_FALSE(resp["result"]["executable"].get<bool>());
  EXPECT_DOUBLE_EQ(resp["result"]["intent"]["account_equity"].get<double>(),
                   100000.0);

  ASSERT_EQ(events.size(), 1u);
  const auto& e = std::get<tradegate::ProposalEvent>(events[0]);
  EXPECT_FALSE(e.executable);
  const std::vector<std::string> expected = {"POLICY_CLEAR",
                                             "EXEC_DAILY_LOSS_CAP"};
  EXPECT_EQ(e.reason_codes, expected);
}

// -----------------------------------------------------------------------------
// 8. PROPOSE errors: missing intent and failed validation.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ProposeErrors) {
  EXPECT_EQ(command({{"cmd", "PROPOSE"}})["response"],
            "PROPOSE requires \"intent\"");

  json intent = spyIntent();
  intent["confidence"] = 150;
  const json resp = command({{"cmd", "PROPOSE"}, {"intent", intent}});
  EXPECT_EQ(resp["status"], "error");
  EXPECT_EQ(resp["response"], "Intent failed validation");
  ASSERT_EQ(resp["validation_errors"].size(), 1u);
  EXPECT_EQ(resp["validation_errors"][0]["field"], "confidence");
  EXPECT_TRUE(events.empty());

  const json bad_enum =
      command({{"cmd", "PROPOSE"}, {"intent", {{"symbol", "SPY"},
                                               {"entry_price", 1},
                                               {"direction", "flat"}}}});
  EXPECT_EQ(bad_enum["response"], "PROPOSE: direction: unknown value 'flat'");
}

// -----------------------------------------------------------------------------
// 9. SESSION reads the phase off the engine clock.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, SessionOverlay) {
  const json crypto = command({{"cmd", "SESSION"}, {"market", "crypto"}});
  ASSERT_EQ(crypto["status"], "ok");
  EXPECT_EQ(crypto["result"]["phase"], "CRYPTO_US");

  const json equities = command({{"cmd", "SESSION"}});
  EXPECT_EQ(equities["result"]["phase"], "MORNING_SESSION");

  EXPECT_EQ(command({{"cmd", "SESSION"}, {"market", "bonds"}})["response"],
            "SESSION: unknown market");
}

// -----------------------------------------------------------------------------
// 10. Scoring commands dispatch to the pure scorers.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ScoringCommands) {
  const json prob = command({{"cmd", "WIN_PROBABILITY"}});
  ASSERT_EQ(prob["status"], "ok");
  EXPECT_DOUBLE_EQ(prob["result"]["win_probability"].get<double>(), 0.5);
  EXPECT_EQ(prob["result"]["confidence_label"], "No Clear Signal");

  const json conf = command({{"cmd", "SCORE_CONFLUENCE"},
                             {"regime", "TRENDING"},
                             {"components", {{"SQ", 80}, {"TA", 75}}}});
  ASSERT_EQ(conf["status"], "ok");
  EXPECT_TRUE(conf["result"].contains("weighted_score"));
  EXPECT_EQ(conf["result"]["components"].size(), 6u);
}

// -----------------------------------------------------------------------------
// 11. Lifecycle with IPC disabled.
// -----------------------------------------------------------------------------
TEST_F(DecisionEngineTest, StartWithoutEndpointsIsNoOp) {
  engine.start();
  engine.start();
  const json status = json::parse(engine.executeCommand("STATUS"));
  EXPECT_FALSE(status["ipc_running"].get<bool>());
  engine.stop();
  engine.stop();
}
