// -----------------------------------------------------------------------------
// tradegate — service entry point.
//
//   1) Load EngineConfig from argv[1] (default config/tradegate.json). A
//      missing or invalid file is reported and the built-in defaults apply.
//   2) Create the live clock, the in-memory account store and the static
//      ATR feed seeded from the config.
//   3) Create the DecisionEngine, attach a logging telemetry sink and start
//      the IPC server (REP for commands, PUB for telemetry).
//   4) Idle on the main thread until SIGINT, then shut down cleanly.
//
// Thread layout:
//   main thread   -> waits on g_running
//   ipc thread    -> IpcServer::run(): commands and telemetry publishing
// -----------------------------------------------------------------------------

#include "tradegate/config/engine_config.hpp"
#include "tradegate/engine/decision_engine.hpp"
#include "tradegate/market/i_account_store.hpp"
#include "tradegate/market/static_atr_source.hpp"
#include "tradegate/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

// Set by the SIGINT handler; polled by main().
static std::atomic<bool> g_running{true};

static void sigint_handler(int /*signum*/) { g_running.store(false); }

static void logEvent(const tradegate::DecisionEvent& event) {
  std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, tradegate::ProposalEvent>) {
          std::cout << "[Telemetry] proposal " << e.proposal_id << " "
                    << e.symbol << (e.executable ? " executable" : " blocked")
                    << "\n";
        } else if constexpr (std::is_same_v<T,
                                            tradegate::PipelineBlockedEvent>) {
          std::cout << "[Telemetry] pipeline blocked " << e.symbol << " "
                    << e.code << "\n";
        } else {
          std::cout << "[Telemetry] circuit " << e.circuit << " "
                    << tradegate::toString(e.from) << " -> "
                    << tradegate::toString(e.to) << "\n";
        }
      },
      event);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/tradegate.json";

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradegate::EngineConfig config;
  try {
    config = tradegate::loadEngineConfig(config_path);
    std::cout << "[main] Loaded config from " << config_path << "\n";
  } catch (const tradegate::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "; using defaults\n";
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators.
  // -------------------------------------------------------------------------
  tradegate::LiveTimeProvider clock;
  tradegate::InMemoryAccountStore accounts;
  tradegate::StaticAtrSource atr_feed;
  for (const auto& [symbol, atr] : config.atr_seeds) {
    atr_feed.set_atr(symbol, atr);
  }

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  tradegate::DecisionEngine engine(clock, atr_feed, accounts, config);
  engine.subscribeTelemetry(logEvent);

  std::signal(SIGINT, sigint_handler);
  engine.start();

  std::cout << "[main] Commands on " << config.ipc_cmd_endpoint
            << ", telemetry on " << config.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for SIGINT.
  // -------------------------------------------------------------------------
  while (g_running.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();
  return 0;
}
