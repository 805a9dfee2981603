#include "swapcore/network/ipc_server.hpp"

#include "swapcore/serialization/execution_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace swapcore {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  try {
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed: " << e.what() << "\n";
    cmd_socket_.reset();
    pub_socket_.reset();
    context_.reset();
    throw;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. telemetry published="
            << telemetry_published_ << " commands=" << commands_served_
            << "\n";
  if (telemetry_dropped_ > 0) {
    std::cerr << "[IpcServer] " << telemetry_dropped_
              << " telemetry message(s) dropped at the PUB high-water mark\n";
  }
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish whatever arrived while shutting down.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): publish the whole backlog
// -----------------------------------------------------------------------------
// PUB never blocks the loop: a message ZMQ cannot queue (high-water mark
// reached) is counted as dropped and reported once at shutdown.
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    const std::string payload = formatTelemetry(event);
    zmq::message_t msg(payload.data(), payload.size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      ++telemetry_published_;
    } else {
      ++telemetry_dropped_;
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply round per call, at most
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
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

  const std::string cmd(static_cast<const char*>(request.data()),
                        request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler threw: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
  ++commands_served_;
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return eventToJson(event).dump();
}

}  // namespace swapcore
