#pragma once

#include "tradegate/concurrent/thread_safe_queue.hpp"
#include "tradegate/events/decision_event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradegate {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ request/telemetry front door for the DecisionEngine
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers command requests on a REP
//         socket and publishes decision telemetry on a PUB socket.
//
// @details
// Two sockets share the worker thread:
//
//   1. REP (default tcp://127.0.0.1:5556)
//      Each request frame is a command string: either a bare word
//      ("PING", "STATUS") or a JSON object with a "cmd" key. The frame is
//      handed to command_handler_ (DecisionEngine::executeCommand) and the
//      returned JSON string is sent back. ZMQ_RCVTIMEO keeps the recv from
//      blocking past kPollTimeoutMs so the loop can drain telemetry.
//
//   2. PUB (default tcp://127.0.0.1:5557)
//      Publishes each DecisionEvent as two frames: a topic
//      ("tradegate.proposal", "tradegate.pipeline_blocked",
//      "tradegate.circuit_state") then the JSON body, so subscribers can
//      filter by prefix. Events arrive via pushTelemetry() from whichever
//      thread produced them and are buffered in a ThreadSafeQueue.
//
// A command handler that throws still gets a reply:
//   {"status":"error","response":"internal error: ..."}
//
// Thread model:
//   start() / stop() from the owning thread. pushTelemetry() from any
//   thread. command_handler_ runs on the worker thread.
//
// Ownership:
//   Owned by DecisionEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // Calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when running.
  // Throws zmq::error_t when an endpoint cannot be bound.
  void start();

  // Joins the worker and closes the sockets. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(DecisionEvent event);

  // Counters since the last start().
  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t eventsPublished() const { return events_published_.load(); }

  // Topic frame published ahead of an event.
  static std::string telemetryTopic(const DecisionEvent& event);

  // JSON frame published for an event.
  static std::string formatTelemetry(const DecisionEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void serveOneCommand();
  std::string answer(const std::string& command) const;

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<DecisionEvent> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> events_published_{0};
};

}  // namespace tradegate
