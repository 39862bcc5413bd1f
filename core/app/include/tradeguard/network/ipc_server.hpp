#pragma once

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IpcServer: operator control socket and escalation stream
// -----------------------------------------------------------------------------
//
// @brief  Serves operator commands on a REP socket and publishes escalated
//         risk events on a PUB socket, from one worker thread.
//
// @details
// Each pass of the worker loop:
//
//   1. Drains the escalation source and publishes every message it yields.
//      PretradeEngine binds the source to RiskService::tryNextViolation(),
//      so subscribers see each High / Critical RiskEvent as a JSON object.
//
//   2. Polls the command socket for up to kPollTimeoutMs. A request is
//      handed to the command handler (PretradeEngine::executeCommand()) and
//      its reply is sent back. A handler that throws still produces a reply,
//      {"status":"error","response":<what()>}, so the REP socket never
//      stalls waiting for a send.
//
// An escalation source that throws is logged and skipped for that pass.
//
// Thread model:
//   Constructed and destroyed on the owner's thread. start() binds the
//   sockets and spawns the worker; stop() clears running_ and joins. Both
//   callbacks run on the worker thread.
//
// Ownership:
//   Owned by PretradeEngine via std::unique_ptr. Owns the ZMQ context (for
//   its whole lifetime), both sockets (between start() and stop()) and the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;
  using EscalationSource = std::function<std::optional<std::string>()>;

  // Creates the ZMQ context. No sockets are bound until start().
  IpcServer(std::string command_endpoint, std::string publish_endpoint,
            CommandHandler command_handler, EscalationSource escalations);

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // @throws zmq::error_t if an endpoint cannot be bound. The server is left
  //         stopped with no sockets open.
  //
  // Idempotent: a no-op while running.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // The context the sockets live in. inproc:// clients must connect through
  // this same context.
  zmq::context_t& context() { return context_; }

  // Serializes {"status":"error","response":message}. Invalid UTF-8 in the
  // message is replaced rather than thrown on.
  static std::string errorReply(const std::string& message);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void publishEscalations();

  // Waits up to kPollTimeoutMs for a request and answers it.
  void serveCommand();

  // Runs the handler; any exception becomes an errorReply().
  std::string dispatch(const std::string& request);

  std::string command_endpoint_;
  std::string publish_endpoint_;
  CommandHandler command_handler_;
  EscalationSource escalations_;

  zmq::context_t context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeguard
