#include "tradegate/network/ipc_server.hpp"

#include "tradegate/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

namespace tradegate {

namespace {

struct TopicVisitor {
  const char* operator()(const ProposalEvent&) const {
    return "tradegate.proposal";
  }
  const char* operator()(const PipelineBlockedEvent&) const {
    return "tradegate.pipeline_blocked";
  }
  const char* operator()(const CircuitStateEvent&) const {
    return "tradegate.circuit_state";
  }
};

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// ---- start ----
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  cmd_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket->set(zmq::sockopt::linger, 0);
  pub_socket->set(zmq::sockopt::linger, 0);
  // Either bind can throw; the locals close whatever was opened.
  cmd_socket->bind(cmd_endpoint_);
  pub_socket->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd_socket);
  pub_socket_ = std::move(pub_socket);
  commands_served_.store(0);
  events_published_.store(0);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Listening for decision commands on "
            << cmd_endpoint_ << ", publishing telemetry on " << pub_endpoint_
            << "\n";
}

// ---- stop ----
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] Stopped after " << commands_served_.load()
            << " commands, " << events_published_.load()
            << " telemetry events.\n";
}

void IpcServer::pushTelemetry(DecisionEvent event) {
  telemetry_queue_.push(std::move(event));
}

// ---- run ----
void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    serveOneCommand();
  }
  publishPending();
}

void IpcServer::publishPending() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string topic = telemetryTopic(*event);
    const std::string payload = formatTelemetry(*event);

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t payload_frame(payload.data(), payload.size());
    // PUB drops under back-pressure rather than stalling command handling.
    if (pub_socket_->send(topic_frame,
                          zmq::send_flags::sndmore | zmq::send_flags::dontwait) &&
        pub_socket_->send(payload_frame, zmq::send_flags::dontwait)) {
      events_published_.fetch_add(1);
    } else {
      std::cerr << "[IpcServer] Dropped " << topic << " event (PUB busy)\n";
    }
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string command(static_cast<const char*>(request.data()),
                            request.size());
  const std::string response = answer(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

// REP requires exactly one reply per request, so handler failures become
// an error document instead of escaping the worker.
std::string IpcServer::answer(const std::string& command) const {
  try {
    return command_handler_(command);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Command handler failed: " << e.what() << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["response"] = std::string("internal error: ") + e.what();
    return err.dump();
  }
}

std::string IpcServer::telemetryTopic(const DecisionEvent& event) {
  return std::visit(TopicVisitor{}, event);
}

std::string IpcServer::formatTelemetry(const DecisionEvent& event) {
  return toJson(event).dump();
}

}  // namespace tradegate
