// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for the IpcServer pieces that need no bound sockets.
//
// Validates:
//   - each DecisionEvent alternative maps to its own topic frame
//   - the body frame is the codec's JSON for the event
//   - a constructed but unstarted server is idle and stop() is harmless
// =============================================================================

#include "tradegate/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>

using tradegate::IpcServer;

// -----------------------------------------------------------------------------
// 1. Topics are prefixed and distinct per event type.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, TelemetryTopics) {
  EXPECT_EQ(IpcServer::telemetryTopic(tradegate::ProposalEvent{}),
            "tradegate.proposal");
  EXPECT_EQ(IpcServer::telemetryTopic(tradegate::PipelineBlockedEvent{}),
            "tradegate.pipeline_blocked");
  EXPECT_EQ(IpcServer::telemetryTopic(tradegate::CircuitStateEvent{}),
            "tradegate.circuit_state");
}

// -----------------------------------------------------------------------------
// 2. Body frame parses back to the event fields.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, TelemetryBody) {
  tradegate::ProposalEvent e;
  e.proposal_id = "prop-7";
  e.symbol = "QQQ";
  e.executable = true;
  e.timestamp_ms = 1234;

  const auto body =
      nlohmann::json::parse(IpcServer::formatTelemetry(tradegate::DecisionEvent{e}));
  EXPECT_EQ(body["type"], "proposal");
  EXPECT_EQ(body["proposal_id"], "prop-7");
  EXPECT_TRUE(body["executable"].get<bool>());
  EXPECT_EQ(body["timestamp_ms"].get<long long>(), 1234);
}

// -----------------------------------------------------------------------------
// 3. No sockets before start(); stop() on an idle server is a no-op.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, IdleServer) {
  IpcServer server([](const std::string& cmd) { return cmd; });
  EXPECT_FALSE(server.running());
  EXPECT_EQ(server.commandsServed(), 0u);
  EXPECT_EQ(server.eventsPublished(), 0u);

  server.pushTelemetry(tradegate::CircuitStateEvent{});
  server.stop();
  server.stop();
  EXPECT_FALSE(server.running());
}
