#pragma once

#include "swapcore/concurrent/thread_safe_queue.hpp"
#include "swapcore/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace swapcore {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command (REP) and telemetry (PUB) endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers command strings on a REP socket and
//         broadcasts telemetry events as JSON on a PUB socket.
//
// @details
//   1. PUB socket (default tcp://127.0.0.1:5557):
//      Every event handed to pushTelemetry() is serialized with
//      eventToJson() and published as one message. Events are buffered in
//      a ThreadSafeQueue so the execution worker never waits on ZMQ I/O.
//
//   2. REP socket (default tcp://127.0.0.1:5556):
//      Each request string is passed to the command handler and its return
//      value sent back. ZMQ_RCVTIMEO keeps the loop alternating between
//      commands and telemetry. A handler that throws std::exception gets
//      a {"status": "error", "response": ...} reply so the REQ peer is
//      never left waiting.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. Idempotent. A bind failure
  // propagates as zmq::error_t and leaves the server stopped.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it (within kPollTimeoutMs) and closes the
  // sockets. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  void pushTelemetry(Event event);

  // JSON text published for `event`.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  // Touched only by the IPC thread, read in stop() after the join.
  std::uint64_t telemetry_published_{0};
  std::uint64_t telemetry_dropped_{0};
  std::uint64_t commands_served_{0};
};

}  // namespace swapcore
